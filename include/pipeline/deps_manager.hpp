// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_status.hpp"
#include "pipeline/block_task.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockdag {
namespace pipeline {

/**
 * DependencyManager - holds blocks until every parent has a processed body
 *
 * One mapping, one lock: the outstanding-parent sets, the reverse
 * parent -> waiters index and the in-flight task table are all guarded by
 * mutex_. Every release decision is made under it; the caller dispatches
 * released tasks after the call returns.
 *
 * A parent counts as resolved once HasValidBody(status). An Invalid parent
 * fails the block immediately. Anything else (unknown, HeaderOnly, or a
 * parent still in flight) is outstanding.
 */
class DependencyManager {
public:
  using StatusLookup = std::function<std::optional<chain::BlockStatus>(const uint256 &)>;

  enum class RegisterResult {
    Ready,        // All parents resolved; caller dispatches the task
    Pending,      // Waiting on at least one parent
    Duplicate,    // Hash already in flight; `existing` holds the live task
    ParentFailed, // A parent is Invalid
    Known,        // Block is past the header stage; nothing to do
    Full,         // Too many pending blocks
  };

  struct Registration {
    RegisterResult result;
    std::shared_ptr<BlockTask> existing; // Set for Duplicate
    std::optional<chain::BlockStatus> known_status; // Set for Known
    uint256 failed_parent;                // Set for ParentFailed
  };

  /**
   * @param status_of Status lookup against the block stores
   * @param max_pending Cap on blocks waiting for parents (0 = unlimited)
   */
  DependencyManager(StatusLookup status_of, size_t max_pending);

  Registration Register(const std::shared_ptr<BlockTask> &task);

  // `parent` has a processed body: returns the waiters released now
  std::vector<std::shared_ptr<BlockTask>> Resolve(const uint256 &parent);

  // `parent` failed: removes every transitive dependent and returns them
  std::vector<std::shared_ptr<BlockTask>> Fail(const uint256 &parent);

  // Drop the in-flight entry for a finished block
  void Complete(const uint256 &hash);

  // Remove and return every pending or in-flight task (shutdown)
  std::vector<std::shared_ptr<BlockTask>> TakeAll();

  // Live task for `hash` if it is pending or in flight
  std::shared_ptr<BlockTask> Find(const uint256 &hash) const;

  bool IsPending(const uint256 &hash) const;
  std::vector<uint256> GetMissingParents(const uint256 &hash) const;
  size_t PendingCount() const;
  size_t InFlightCount() const;

private:
  using HashSet = std::unordered_set<uint256, util::Uint256Hasher>;

  // Remove `hash` from pending_ and waiters_ (mutex_ held)
  void ForgetPendingLocked(const uint256 &hash);

  StatusLookup status_of_;
  const size_t max_pending_;

  mutable std::mutex mutex_;
  std::unordered_map<uint256, std::shared_ptr<BlockTask>, util::Uint256Hasher> tasks_;
  std::unordered_map<uint256, HashSet, util::Uint256Hasher> pending_;
  std::unordered_map<uint256, HashSet, util::Uint256Hasher> waiters_;
};

} // namespace pipeline
} // namespace blockdag
