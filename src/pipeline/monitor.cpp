// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/monitor.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace blockdag {
namespace pipeline {

ConsensusMonitor::ConsensusMonitor(const ProcessingCounters &counters,
                                   std::chrono::milliseconds interval)
    : counters_(counters), interval_(interval) {}

ConsensusMonitor::~ConsensusMonitor() { Stop(); }

void ConsensusMonitor::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable() || interval_.count() <= 0) {
    return;
  }
  stop_ = false;
  thread_ = std::thread(&ConsensusMonitor::Run, this);
}

void ConsensusMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ConsensusMonitor::Run() {
  ProcessingCountersSnapshot last = counters_.Snapshot();
  auto last_time = util::GetSteadyTime();

  std::unique_lock<std::mutex> lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [this] { return stop_; })) {
    lock.unlock();
    const ProcessingCountersSnapshot now = counters_.Snapshot();
    const auto now_time = util::GetSteadyTime();
    const ProcessingCountersSnapshot window = now - last;
    if (window.header_counts > 0 || window.body_counts > 0 || window.chain_block_counts > 0) {
      Report(window, std::chrono::duration_cast<std::chrono::milliseconds>(now_time - last_time));
    }
    last = now;
    last_time = now_time;
    lock.lock();
  }
}

void ConsensusMonitor::Report(const ProcessingCountersSnapshot &window,
                              std::chrono::milliseconds elapsed) {
  const double seconds = elapsed.count() > 0 ? static_cast<double>(elapsed.count()) / 1000.0 : 1.0;
  const double mean_parents =
      window.header_counts > 0
          ? static_cast<double>(window.dep_counts) / static_cast<double>(window.header_counts)
          : 0.0;

  LOG_PIPE_INFO("Processed {} blocks and {} headers in the last {:.2f}s ({} transactions; {} "
                "UTXO-validated blocks; {:.2f} parents; {} mass; {:.2f} TPS)",
                window.body_counts, window.header_counts, seconds, window.txs_counts,
                window.chain_block_counts, mean_parents, window.mass_counts,
                static_cast<double>(window.txs_counts) / seconds);
}

} // namespace pipeline
} // namespace blockdag
