// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/deps_manager.hpp"
#include "util/logging.hpp"
#include <deque>

namespace blockdag {
namespace pipeline {

DependencyManager::DependencyManager(StatusLookup status_of, size_t max_pending)
    : status_of_(std::move(status_of)), max_pending_(max_pending) {}

DependencyManager::Registration
DependencyManager::Register(const std::shared_ptr<BlockTask> &task) {
  const uint256 &hash = task->hash();
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = tasks_.find(hash);
  if (existing != tasks_.end()) {
    return {RegisterResult::Duplicate, existing->second, std::nullopt, uint256()};
  }

  // Statuses are read under mutex_ so a concurrent Resolve() of a parent
  // either happened before (status visible) or will see this waiter
  auto status = status_of_(hash);
  if (status && *status != chain::BlockStatus::HeaderOnly) {
    return {RegisterResult::Known, nullptr, status, uint256()};
  }

  HashSet outstanding;
  for (const auto &parent : task->block().header.DirectParents()) {
    auto parent_status = status_of_(parent);
    if (parent_status && *parent_status == chain::BlockStatus::Invalid) {
      return {RegisterResult::ParentFailed, nullptr, std::nullopt, parent};
    }
    if (parent_status && chain::HasValidBody(*parent_status)) {
      continue;
    }
    outstanding.insert(parent);
  }

  if (outstanding.empty()) {
    tasks_.emplace(hash, task);
    return {RegisterResult::Ready, nullptr, std::nullopt, uint256()};
  }

  if (max_pending_ > 0 && pending_.size() >= max_pending_) {
    return {RegisterResult::Full, nullptr, std::nullopt, uint256()};
  }

  for (const auto &parent : outstanding) {
    waiters_[parent].insert(hash);
  }
  LOG_PIPE_DEBUG("Block {} pending on {} parent(s)", hash.ToShortString(), outstanding.size());
  pending_.emplace(hash, std::move(outstanding));
  tasks_.emplace(hash, task);
  return {RegisterResult::Pending, nullptr, std::nullopt, uint256()};
}

std::vector<std::shared_ptr<BlockTask>> DependencyManager::Resolve(const uint256 &parent) {
  std::vector<std::shared_ptr<BlockTask>> released;
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = waiters_.find(parent);
  if (it == waiters_.end()) {
    return released;
  }
  HashSet waiting = std::move(it->second);
  waiters_.erase(it);

  for (const auto &child : waiting) {
    auto pending_it = pending_.find(child);
    if (pending_it == pending_.end()) {
      continue;
    }
    pending_it->second.erase(parent);
    if (pending_it->second.empty()) {
      // Erasing the entry is the release; no other path can reach it now
      pending_.erase(pending_it);
      auto task_it = tasks_.find(child);
      if (task_it != tasks_.end()) {
        released.push_back(task_it->second);
      }
    }
  }

  if (!released.empty()) {
    LOG_PIPE_DEBUG("Parent {} released {} block(s)", parent.ToShortString(), released.size());
  }
  return released;
}

std::vector<std::shared_ptr<BlockTask>> DependencyManager::Fail(const uint256 &parent) {
  std::vector<std::shared_ptr<BlockTask>> failed;
  std::lock_guard<std::mutex> lock(mutex_);

  std::deque<uint256> queue{parent};
  while (!queue.empty()) {
    const uint256 current = queue.front();
    queue.pop_front();

    auto it = waiters_.find(current);
    if (it == waiters_.end()) {
      continue;
    }
    HashSet waiting = std::move(it->second);
    waiters_.erase(it);

    for (const auto &child : waiting) {
      if (!pending_.count(child)) {
        continue; // Already failed through another parent
      }
      ForgetPendingLocked(child);
      auto task_it = tasks_.find(child);
      if (task_it != tasks_.end()) {
        failed.push_back(task_it->second);
        tasks_.erase(task_it);
      }
      queue.push_back(child);
    }
  }

  if (!failed.empty()) {
    LOG_PIPE_DEBUG("Failure of {} dropped {} dependent block(s)", parent.ToShortString(),
                   failed.size());
  }
  return failed;
}

void DependencyManager::Complete(const uint256 &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.erase(hash);
}

std::vector<std::shared_ptr<BlockTask>> DependencyManager::TakeAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<BlockTask>> all;
  all.reserve(tasks_.size());
  for (auto &[hash, task] : tasks_) {
    all.push_back(std::move(task));
  }
  tasks_.clear();
  pending_.clear();
  waiters_.clear();
  return all;
}

std::shared_ptr<BlockTask> DependencyManager::Find(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(hash);
  return it == tasks_.end() ? nullptr : it->second;
}

bool DependencyManager::IsPending(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(hash) > 0;
}

std::vector<uint256> DependencyManager::GetMissingParents(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(hash);
  if (it == pending_.end()) {
    return {};
  }
  return std::vector<uint256>(it->second.begin(), it->second.end());
}

size_t DependencyManager::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

size_t DependencyManager::InFlightCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void DependencyManager::ForgetPendingLocked(const uint256 &hash) {
  auto it = pending_.find(hash);
  if (it == pending_.end()) {
    return;
  }
  for (const auto &parent : it->second) {
    auto waiter_it = waiters_.find(parent);
    if (waiter_it != waiters_.end()) {
      waiter_it->second.erase(hash);
      if (waiter_it->second.empty()) {
        waiters_.erase(waiter_it);
      }
    }
  }
  pending_.erase(it);
}

} // namespace pipeline
} // namespace blockdag
