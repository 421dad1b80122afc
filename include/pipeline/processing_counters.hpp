// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace blockdag {
namespace pipeline {

/**
 * Point-in-time copy of the processing counters
 *
 * Counters only grow, so `later - earlier` is the activity in between.
 * Subtracting in the wrong order is a caller bug and throws
 * std::invalid_argument rather than wrapping.
 */
struct ProcessingCountersSnapshot {
  uint64_t blocks_submitted{0};
  uint64_t header_counts{0};
  uint64_t dep_counts{0};
  uint64_t body_counts{0};
  uint64_t txs_counts{0};
  uint64_t chain_block_counts{0};
  uint64_t mass_counts{0};

  friend bool operator==(const ProcessingCountersSnapshot &,
                         const ProcessingCountersSnapshot &) = default;

  ProcessingCountersSnapshot operator-(const ProcessingCountersSnapshot &rhs) const;

  std::string ToString() const;
};

/**
 * Pipeline activity counters
 *
 * Increment-only, relaxed atomics: observability only, never used for
 * control flow.
 */
class ProcessingCounters {
public:
  std::atomic<uint64_t> blocks_submitted{0};
  std::atomic<uint64_t> header_counts{0};
  std::atomic<uint64_t> dep_counts{0};
  std::atomic<uint64_t> body_counts{0};
  std::atomic<uint64_t> txs_counts{0};
  std::atomic<uint64_t> chain_block_counts{0};
  std::atomic<uint64_t> mass_counts{0};

  ProcessingCountersSnapshot Snapshot() const;
};

} // namespace pipeline
} // namespace blockdag
