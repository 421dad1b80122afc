// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace blockdag {
namespace network {

MessageDispatcher::MessageDispatcher() {
  error_handler_ = [](const RouterPtr &router, const ProtocolError &error) {
    LOG_NET_WARN("Disconnecting peer={} ({}): {} [{}]", router->id(), router->address(),
                 error.what(), ProtocolErrorKindToString(error.kind()));
    router->Close(error.what());
  };
}

void MessageDispatcher::Route(const std::string &command, Handler handler) {
  if (command.empty()) {
    throw std::invalid_argument("route for an empty command");
  }
  if (!handler) {
    throw std::invalid_argument("empty handler for " + command);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!routes_.emplace(command, std::move(handler)).second) {
    throw std::invalid_argument("command " + command + " is already routed");
  }
  LOG_NET_DEBUG("Routed {}", command);
}

bool MessageDispatcher::Unroute(const std::string &command) {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.erase(command) > 0;
}

void MessageDispatcher::SetErrorHandler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_handler_ = std::move(handler);
}

MessageDispatcher::Result MessageDispatcher::Dispatch(const RouterPtr &router,
                                                      const message::Message &msg) {
  const std::string command = msg.command();
  if (!router) {
    LOG_NET_WARN("Dropping {} without a route back to the peer", command);
    return Result::Failed;
  }

  Handler handler;
  ErrorHandler on_error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(command);
    if (it == routes_.end()) {
      LOG_NET_TRACE("Ignoring {} from peer={}: no route", command, router->id());
      return Result::Unrouted;
    }
    handler = it->second;
    on_error = error_handler_;
  }

  try {
    handler(router, msg);
    return Result::Handled;
  } catch (const ProtocolError &e) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_DEBUG("{} from peer={} rejected: {} [{}]", command, router->id(), e.what(),
                  ProtocolErrorKindToString(e.kind()));
    if (on_error) {
      on_error(router, e);
    }
    return Result::Rejected;
  } catch (const std::exception &e) {
    LOG_NET_ERROR("Route {} failed for peer={}: {}", command, router->id(), e.what());
    return Result::Failed;
  }
}

bool MessageDispatcher::HasRoute(const std::string &command) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.count(command) > 0;
}

std::vector<std::string> MessageDispatcher::Commands() const {
  std::vector<std::string> commands;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commands.reserve(routes_.size());
    for (const auto &[command, handler] : routes_) {
      commands.push_back(command);
    }
  }
  std::sort(commands.begin(), commands.end());
  return commands;
}

const char *DispatchResultToString(MessageDispatcher::Result result) {
  switch (result) {
  case MessageDispatcher::Result::Handled:
    return "handled";
  case MessageDispatcher::Result::Unrouted:
    return "unrouted";
  case MessageDispatcher::Result::Rejected:
    return "rejected";
  case MessageDispatcher::Result::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace network
} // namespace blockdag
