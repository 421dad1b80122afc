// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace blockdag {
namespace network {

enum class ProtocolErrorKind {
  UnknownBlock,      // Requested hash not in the DAG (or invalid)
  TraversalLimit,    // Request exceeds the allowed traversal
  ConsensusError,    // Internal lookup failure while answering
  RouteClosed,       // Peer route closed before the answer was queued
  UnexpectedMessage, // Message of the wrong type for the flow
};

const char *ProtocolErrorKindToString(ProtocolErrorKind kind);

/**
 * Error raised by a sync flow against one peer
 *
 * The flow's error handler decides what happens to the peer; the default
 * closes the route.
 */
class ProtocolError : public std::runtime_error {
public:
  ProtocolError(ProtocolErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ProtocolErrorKind kind() const { return kind_; }

private:
  ProtocolErrorKind kind_;
};

} // namespace network
} // namespace blockdag
