// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/router.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blockdag {
namespace test {

/**
 * FakeRouter - in-memory Router capturing everything a flow sends
 *
 * Close() flips the route closed; later Enqueue() calls fail like a torn
 * down connection would.
 */
class FakeRouter : public network::Router {
public:
  explicit FakeRouter(uint64_t id) : id_(id) {}

  uint64_t id() const override { return id_; }
  std::string address() const override { return "127.0.0.1:" + std::to_string(18000 + id_); }

  bool Enqueue(std::unique_ptr<message::Message> msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    sent_.push_back(std::move(msg));
    return true;
  }

  void Close(const std::string &reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    close_reason_ = reason;
  }

  bool IsClosed() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::vector<std::string> Commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> commands;
    for (const auto &msg : sent_) {
      commands.push_back(msg->command());
    }
    return commands;
  }

  // nullptr if fewer messages were sent or the type does not match
  template <typename T> const T *Sent(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= sent_.size()) {
      return nullptr;
    }
    return dynamic_cast<const T *>(sent_[index].get());
  }

  size_t SentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_.size();
  }

  std::string CloseReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
  }

private:
  const uint64_t id_;
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<message::Message>> sent_;
  bool closed_{false};
  std::string close_reason_;
};

} // namespace test
} // namespace blockdag
