// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/processing_counters.hpp"
#include <sstream>
#include <stdexcept>

namespace blockdag {
namespace pipeline {

namespace {

uint64_t CheckedSub(uint64_t lhs, uint64_t rhs, const char *field) {
  if (lhs < rhs) {
    throw std::invalid_argument(std::string("ProcessingCountersSnapshot: ") + field +
                                " would underflow (" + std::to_string(lhs) + " - " +
                                std::to_string(rhs) + "); snapshots diffed out of order");
  }
  return lhs - rhs;
}

} // namespace

ProcessingCountersSnapshot
ProcessingCountersSnapshot::operator-(const ProcessingCountersSnapshot &rhs) const {
  ProcessingCountersSnapshot out;
  out.blocks_submitted = CheckedSub(blocks_submitted, rhs.blocks_submitted, "blocks_submitted");
  out.header_counts = CheckedSub(header_counts, rhs.header_counts, "header_counts");
  out.dep_counts = CheckedSub(dep_counts, rhs.dep_counts, "dep_counts");
  out.body_counts = CheckedSub(body_counts, rhs.body_counts, "body_counts");
  out.txs_counts = CheckedSub(txs_counts, rhs.txs_counts, "txs_counts");
  out.chain_block_counts =
      CheckedSub(chain_block_counts, rhs.chain_block_counts, "chain_block_counts");
  out.mass_counts = CheckedSub(mass_counts, rhs.mass_counts, "mass_counts");
  return out;
}

std::string ProcessingCountersSnapshot::ToString() const {
  std::ostringstream s;
  s << "blocks_submitted=" << blocks_submitted << " headers=" << header_counts
    << " deps=" << dep_counts << " bodies=" << body_counts << " txs=" << txs_counts
    << " chain_blocks=" << chain_block_counts << " mass=" << mass_counts;
  return s.str();
}

ProcessingCountersSnapshot ProcessingCounters::Snapshot() const {
  ProcessingCountersSnapshot snapshot;
  snapshot.blocks_submitted = blocks_submitted.load(std::memory_order_relaxed);
  snapshot.header_counts = header_counts.load(std::memory_order_relaxed);
  snapshot.dep_counts = dep_counts.load(std::memory_order_relaxed);
  snapshot.body_counts = body_counts.load(std::memory_order_relaxed);
  snapshot.txs_counts = txs_counts.load(std::memory_order_relaxed);
  snapshot.chain_block_counts = chain_block_counts.load(std::memory_order_relaxed);
  snapshot.mass_counts = mass_counts.load(std::memory_order_relaxed);
  return snapshot;
}

} // namespace pipeline
} // namespace blockdag
