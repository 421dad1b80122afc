// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol_error.hpp"
#include "network/router.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace blockdag {
namespace network {

/**
 * MessageDispatcher - routes incoming peer messages to the sync flows
 *
 * Each command has exactly one route. Typed routes check the dynamic type
 * of the message before the flow sees it, so a flow only handles the
 * message class it registered for.
 *
 * Errors:
 * - a route reports a misbehaving peer by throwing ProtocolError; the
 *   error handler decides what happens to the peer (default: close the
 *   route), the same policy the sync flows apply to failed answers
 * - any other exception is logged and the peer is kept
 * - commands without a route are ignored
 *
 * Routes run on the caller's thread outside the dispatcher lock. The
 * message is borrowed for the duration of the call; flows copy what they
 * queue.
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   sync.RegisterHandlers(dispatcher);
 *   dispatcher.Dispatch(router, *msg);
 */
class MessageDispatcher {
public:
  using Handler = std::function<void(const RouterPtr &, const message::Message &)>;
  using ErrorHandler = std::function<void(const RouterPtr &, const ProtocolError &)>;

  enum class Result {
    Handled,  // The route ran to completion
    Unrouted, // No route for the command
    Rejected, // The route raised a ProtocolError; the error handler ran
    Failed,   // The route threw anything else, or there was no router
  };

  MessageDispatcher();

  MessageDispatcher(const MessageDispatcher &) = delete;
  MessageDispatcher &operator=(const MessageDispatcher &) = delete;

  // Throws std::invalid_argument for an empty command or handler, or a
  // command that is already routed
  void Route(const std::string &command, Handler handler);

  // Route keyed by MessageT's command; other message classes arriving under
  // that command are rejected as UnexpectedMessage
  template <typename MessageT>
  void Route(std::function<void(const RouterPtr &, const MessageT &)> handler) {
    static_assert(std::is_base_of_v<message::Message, MessageT>,
                  "routes are registered for message types");
    if (!handler) {
      throw std::invalid_argument("empty handler for " + MessageT().command());
    }
    const std::string command = MessageT().command();
    Route(command, [command, handler = std::move(handler)](const RouterPtr &router,
                                                           const message::Message &msg) {
      const auto *typed = dynamic_cast<const MessageT *>(&msg);
      if (!typed) {
        throw ProtocolError(ProtocolErrorKind::UnexpectedMessage,
                            "message routed as " + command + " has the wrong type");
      }
      handler(router, *typed);
    });
  }

  // Returns false if the command had no route
  bool Unroute(const std::string &command);

  void SetErrorHandler(ErrorHandler handler);

  Result Dispatch(const RouterPtr &router, const message::Message &msg);

  bool HasRoute(const std::string &command) const;

  // Routed commands, sorted
  std::vector<std::string> Commands() const;

  uint64_t RejectedCount() const { return rejected_.load(std::memory_order_relaxed); }

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Handler> routes_;
  ErrorHandler error_handler_;
  std::atomic<uint64_t> rejected_{0};
};

const char *DispatchResultToString(MessageDispatcher::Result result);

} // namespace network
} // namespace blockdag
