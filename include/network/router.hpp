// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace blockdag {

namespace message {
class Message;
} // namespace message

namespace network {

/**
 * Router - outgoing side of one peer connection
 *
 * Implemented by the transport; sync flows only enqueue typed messages and
 * close the route on protocol errors. Implementations must be thread-safe.
 */
class Router {
public:
  virtual ~Router() = default;

  virtual uint64_t id() const = 0;
  virtual std::string address() const = 0;

  // Queue a message for the peer. Returns false if the route is closed.
  virtual bool Enqueue(std::unique_ptr<message::Message> msg) = 0;

  // Disconnect the peer
  virtual void Close(const std::string &reason) = 0;

  virtual bool IsClosed() const = 0;
};

using RouterPtr = std::shared_ptr<Router>;

} // namespace network
} // namespace blockdag
