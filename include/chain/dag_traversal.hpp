// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace blockdag {
namespace chain {

class BlockManager;

using HashSet = std::unordered_set<uint256, util::Uint256Hasher>;

// A bounded traversal visited more blocks than allowed
class TraversalLimitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * DagTraversal - ancestry queries over level-0 relations
 *
 * blue_work strictly increases along every parent->child edge, so a search
 * for `ancestor` walking down from `descendant` can drop any block whose
 * blue_work is not above blue_work(ancestor). Blocks whose records are gone
 * (pruned) end the walk on that branch.
 */
class DagTraversal {
public:
  explicit DagTraversal(const BlockManager &blocks);

  // True if ancestor == descendant or ancestor is in past(descendant).
  // Throws StoreError if either endpoint has no GHOSTDAG data.
  bool IsDagAncestorOf(const uint256 &ancestor, const uint256 &descendant) const;

  // True if some block of `ancestors` is a DAG ancestor of `descendant`
  bool IsDagAncestorOfAny(const uint256 &descendant, const std::vector<uint256> &ancestors) const;

  // anticone(block) intersected with past(context) (context excluded).
  // Throws TraversalLimitError once more than max_traversal blocks were
  // visited (0 = unbounded), StoreError on unknown endpoints.
  std::vector<uint256> AnticoneFromPov(const uint256 &block, const uint256 &context,
                                       size_t max_traversal) const;

  // {block} plus every block reachable through children
  HashSet FutureOf(const uint256 &block) const;

private:
  const BlockManager &blocks_;
};

} // namespace chain
} // namespace blockdag
