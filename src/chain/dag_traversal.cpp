// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/dag_traversal.hpp"
#include "chain/block_manager.hpp"
#include "util/logging.hpp"
#include <deque>

namespace blockdag {
namespace chain {

DagTraversal::DagTraversal(const BlockManager &blocks) : blocks_(blocks) {}

bool DagTraversal::IsDagAncestorOf(const uint256 &ancestor, const uint256 &descendant) const {
  if (ancestor == descendant) {
    return true;
  }

  const arith_uint256 floor = blocks_.GetGhostdagData(ancestor)->blue_work;
  if (blocks_.GetGhostdagData(descendant)->blue_work <= floor) {
    return false;
  }

  std::deque<uint256> queue{descendant};
  HashSet visited{descendant};
  while (!queue.empty()) {
    const uint256 current = queue.front();
    queue.pop_front();
    for (const auto &parent : blocks_.GetParents(current)) {
      if (parent == ancestor) {
        return true;
      }
      if (!visited.insert(parent).second) {
        continue;
      }
      auto data = blocks_.TryGetGhostdagData(parent);
      if (!data || data->blue_work <= floor) {
        continue;
      }
      queue.push_back(parent);
    }
  }
  return false;
}

bool DagTraversal::IsDagAncestorOfAny(const uint256 &descendant,
                                      const std::vector<uint256> &ancestors) const {
  for (const auto &ancestor : ancestors) {
    if (IsDagAncestorOf(ancestor, descendant)) {
      return true;
    }
  }
  return false;
}

std::vector<uint256> DagTraversal::AnticoneFromPov(const uint256 &block, const uint256 &context,
                                                   size_t max_traversal) const {
  // Both endpoints must be known
  blocks_.GetGhostdagData(block);
  blocks_.GetGhostdagData(context);

  std::vector<uint256> anticone;
  std::deque<uint256> queue;
  HashSet visited;
  for (const auto &parent : blocks_.GetParents(context)) {
    if (visited.insert(parent).second) {
      queue.push_back(parent);
    }
  }

  size_t traversed = 0;
  while (!queue.empty()) {
    const uint256 current = queue.front();
    queue.pop_front();

    if (!blocks_.TryGetGhostdagData(current)) {
      continue; // Pruned
    }

    // block itself or its past: nothing below can be in its anticone
    if (IsDagAncestorOf(current, block)) {
      continue;
    }

    // Only blocks outside past(block) count toward the limit
    if (max_traversal != 0 && ++traversed > max_traversal) {
      throw TraversalLimitError("anticone traversal of " + block.ToString() +
                                " from " + context.ToString() + " exceeded " +
                                std::to_string(max_traversal) + " blocks");
    }

    // Future of block is expanded but not reported
    if (!IsDagAncestorOf(block, current)) {
      anticone.push_back(current);
    }

    for (const auto &parent : blocks_.GetParents(current)) {
      if (visited.insert(parent).second) {
        queue.push_back(parent);
      }
    }
  }

  LOG_CHAIN_TRACE("AnticoneFromPov: block={} context={} traversed={} anticone={}",
                  block.ToShortString(), context.ToShortString(), traversed,
                  anticone.size());
  return anticone;
}

HashSet DagTraversal::FutureOf(const uint256 &block) const {
  HashSet future{block};
  std::deque<uint256> queue{block};
  while (!queue.empty()) {
    const uint256 current = queue.front();
    queue.pop_front();
    for (const auto &child : blocks_.GetChildren(current)) {
      if (future.insert(child).second) {
        queue.push_back(child);
      }
    }
  }
  return future;
}

} // namespace chain
} // namespace blockdag
