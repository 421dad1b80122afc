// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol_error.hpp"

namespace blockdag {
namespace network {

const char *ProtocolErrorKindToString(ProtocolErrorKind kind) {
  switch (kind) {
  case ProtocolErrorKind::UnknownBlock:
    return "unknown-block";
  case ProtocolErrorKind::TraversalLimit:
    return "traversal-limit";
  case ProtocolErrorKind::ConsensusError:
    return "consensus-error";
  case ProtocolErrorKind::RouteClosed:
    return "route-closed";
  case ProtocolErrorKind::UnexpectedMessage:
    return "unexpected-message";
  }
  return "unknown";
}

} // namespace network
} // namespace blockdag
