#pragma once

#include "network/protocol.hpp"
#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace blockdag {
namespace message {

/**
 * Base class for all message payloads
 *
 * Messages travel between flows and routers as typed objects; framing
 * and wire encoding belong to the transport behind the Router.
 */
class Message {
public:
  virtual ~Message() = default;

  // Get command name for this message type
  virtual std::string command() const = 0;
};

/**
 * REQUESTANTICONE message - anticone(block) within past(context)
 */
class RequestAnticoneMessage : public Message {
public:
  uint256 block;
  uint256 context;

  RequestAnticoneMessage() = default;
  RequestAnticoneMessage(const uint256 &block_in, const uint256 &context_in)
      : block(block_in), context(context_in) {}

  std::string command() const override { return protocol::commands::REQUEST_ANTICONE; }
};

/**
 * BLOCKHEADERS message - headers in ascending (blue_work, hash) order
 */
class BlockHeadersMessage : public Message {
public:
  std::vector<::CBlockHeader> headers;

  BlockHeadersMessage() = default;
  explicit BlockHeadersMessage(std::vector<::CBlockHeader> h) : headers(std::move(h)) {}

  std::string command() const override { return protocol::commands::BLOCK_HEADERS; }
};

/**
 * DONEHEADERS message - terminates a header stream
 */
class DoneHeadersMessage : public Message {
public:
  DoneHeadersMessage() = default;

  std::string command() const override { return protocol::commands::DONE_HEADERS; }
};

/**
 * REQUESTPRUNINGPOINT message - ask for the current pruning point
 */
class RequestPruningPointMessage : public Message {
public:
  RequestPruningPointMessage() = default;

  std::string command() const override { return protocol::commands::REQUEST_PRUNING_POINT; }
};

/**
 * PRUNINGPOINT message - pruning point hash and blue score
 */
class PruningPointMessage : public Message {
public:
  uint256 hash;
  uint64_t blue_score{0};

  PruningPointMessage() = default;
  PruningPointMessage(const uint256 &h, uint64_t score) : hash(h), blue_score(score) {}

  std::string command() const override { return protocol::commands::PRUNING_POINT; }
};

// Factory function to create message from command name (nullptr if unknown)
std::unique_ptr<Message> create_message(const std::string &command);

} // namespace message
} // namespace blockdag
