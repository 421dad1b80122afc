#include "network/message.hpp"

namespace blockdag {
namespace message {

std::unique_ptr<Message> create_message(const std::string &command) {
  if (command == protocol::commands::REQUEST_ANTICONE) {
    return std::make_unique<RequestAnticoneMessage>();
  } else if (command == protocol::commands::BLOCK_HEADERS) {
    return std::make_unique<BlockHeadersMessage>();
  } else if (command == protocol::commands::DONE_HEADERS) {
    return std::make_unique<DoneHeadersMessage>();
  } else if (command == protocol::commands::REQUEST_PRUNING_POINT) {
    return std::make_unique<RequestPruningPointMessage>();
  } else if (command == protocol::commands::PRUNING_POINT) {
    return std::make_unique<PruningPointMessage>();
  }
  return nullptr;
}

} // namespace message
} // namespace blockdag
