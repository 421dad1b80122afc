// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "pipeline/processing_counters.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace blockdag {
namespace pipeline {

/**
 * ConsensusMonitor - periodic throughput report
 *
 * Diffs consecutive counter snapshots every interval and logs the window
 * on the pipeline logger. Nothing is logged for idle windows.
 */
class ConsensusMonitor {
public:
  ConsensusMonitor(const ProcessingCounters &counters, std::chrono::milliseconds interval);
  ~ConsensusMonitor();

  ConsensusMonitor(const ConsensusMonitor &) = delete;
  ConsensusMonitor &operator=(const ConsensusMonitor &) = delete;

  void Start();
  void Stop();

  // Log one window (exposed for tests and the simulator's final report)
  static void Report(const ProcessingCountersSnapshot &window, std::chrono::milliseconds elapsed);

private:
  void Run();

  const ProcessingCounters &counters_;
  const std::chrono::milliseconds interval_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_{false};
  std::thread thread_;
};

} // namespace pipeline
} // namespace blockdag
