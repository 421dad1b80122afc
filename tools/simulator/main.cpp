// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// blockdag-sim - simulated miner network feeding the consensus pipeline

#include "network_simulator.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors before the logger exists
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Simulation:\n"
      << "  --bps=<x>                Blocks per second (default: 1.0)\n"
      << "  --delay=<seconds>        Max block propagation delay (default: 2.0)\n"
      << "  --miners=<n>             Number of miners (default: 1)\n"
      << "  --tpb=<n>                Target transactions per block (default: 200)\n"
      << "  --sim-time=<seconds>     Simulated duration (default: 600)\n"
      << "  --target-blocks=<n>      Stop after n blocks (overrides --sim-time)\n"
      << "  --processors-threads=<n> Header/body worker threads (default: CPU count)\n"
      << "  --test-pruning           Shorten pruning constants and skip re-validation\n"
      << "  --seed=<n>               Random seed (default: random)\n"
      << "\n"
      << "Data:\n"
      << "  --output=<path>          Export the simulated DAG as JSON\n"
      << "  --input=<path>           Re-validate a previously exported DAG instead of\n"
      << "                           simulating (simulation args must match the run)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       Global log level (trace,debug,info,warn,error,critical)\n"
      << "  --debug=<component>      Trace logging for component(s), comma-separated\n"
      << "                           Components: network, sync, chain, pipeline, app, all\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n"
      << std::endl;
}

bool parse_u64(const std::string &value, const char *name, uint64_t min, uint64_t &out) {
  auto parsed = blockdag::util::SafeParseInt64(value, static_cast<int64_t>(min),
                                               std::numeric_limits<int64_t>::max());
  if (!parsed) {
    std::cerr << "Error: Invalid " << name << ": " << value << std::endl;
    return false;
  }
  out = static_cast<uint64_t>(*parsed);
  return true;
}

bool parse_double(const std::string &value, const char *name, double min, double max,
                  double &out) {
  auto parsed = blockdag::util::SafeParseDouble(value, min, max);
  if (!parsed) {
    std::cerr << "Error: Invalid " << name << ": " << value << " (expected " << min << " to "
              << max << ")" << std::endl;
    return false;
  }
  out = *parsed;
  return true;
}

std::vector<std::string> split_components(const std::string &components) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < components.length()) {
    size_t comma = components.find(',', pos);
    if (comma == std::string::npos) {
      out.push_back(components.substr(pos));
      break;
    }
    out.push_back(components.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace blockdag;

  try {
    sim::SimulatorOptions options;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--bps=") == 0) {
        if (!parse_double(arg.substr(6), "bps", 0.001, 10'000.0, options.bps)) {
          return 1;
        }
      } else if (arg.find("--delay=") == 0) {
        if (!parse_double(arg.substr(8), "delay", 0.0, 3'600.0, options.delay)) {
          return 1;
        }
      } else if (arg.find("--miners=") == 0) {
        if (!parse_u64(arg.substr(9), "miners", 1, options.miners)) {
          return 1;
        }
      } else if (arg.find("--tpb=") == 0) {
        if (!parse_u64(arg.substr(6), "tpb", 0, options.tpb)) {
          return 1;
        }
      } else if (arg.find("--sim-time=") == 0) {
        if (!parse_u64(arg.substr(11), "sim-time", 1, options.sim_time)) {
          return 1;
        }
      } else if (arg.find("--target-blocks=") == 0) {
        uint64_t target = 0;
        if (!parse_u64(arg.substr(16), "target-blocks", 1, target)) {
          return 1;
        }
        options.target_blocks = target;
      } else if (arg.find("--processors-threads=") == 0) {
        uint64_t threads = 0;
        if (!parse_u64(arg.substr(21), "processors-threads", 1, threads)) {
          return 1;
        }
        options.processors_threads = static_cast<size_t>(threads);
      } else if (arg.find("--seed=") == 0) {
        if (!parse_u64(arg.substr(7), "seed", 0, options.seed)) {
          return 1;
        }
      } else if (arg == "--test-pruning") {
        options.test_pruning = true;
      } else if (arg.find("--output=") == 0) {
        options.output = arg.substr(9);
      } else if (arg.find("--input=") == 0) {
        options.input = arg.substr(8);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (auto &component : split_components(arg.substr(8))) {
          debug_components.push_back(std::move(component));
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (options.bps * options.delay >= 250.0) {
      std::cerr << "Error: The delay times bps product is larger than 250" << std::endl;
      return 1;
    }

    util::LogManager::Initialize(log_level, false, "");
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        util::LogManager::SetComponentLevel("network", "trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    LOG_INFO("blockdag-sim v{}", GetVersionString());
    if (options.miners > 1) {
      LOG_WARN("Number of miners was configured to {}. Each miner runs its own consensus, so "
               "memory and runtime grow with every miner added, while a single miner is "
               "sufficient for most simulation purposes (delay is simulated anyway).",
               options.miners);
    }

    auto params = chain::ChainParams::CreateSimNet();
    sim::ApplyArgsToConsensusParams(options, *params);

    int exit_code = 0;
    {
      std::vector<std::shared_ptr<const CBlock>> blocks;
      std::unique_ptr<sim::NetworkSimulator> simulator;

      if (!options.input.empty()) {
        std::vector<CBlock> loaded;
        if (!chain::BlockManager::LoadBlocks(options.input,
                                             params->GetConsensus().hashGenesisBlock, loaded)) {
          LOG_ERROR("Failed to load DAG from {}", options.input);
          util::LogManager::Shutdown();
          return 1;
        }
        blocks.reserve(loaded.size());
        for (auto &block : loaded) {
          blocks.push_back(std::make_shared<const CBlock>(std::move(block)));
        }
        LOG_INFO("Loaded {} blocks from {}", blocks.size(), options.input);
      } else {
        const uint64_t until =
            options.target_blocks
                ? std::numeric_limits<uint64_t>::max()
                : params->GenesisBlock().header.nTime + options.sim_time * 1000;
        simulator = std::make_unique<sim::NetworkSimulator>(*params, options);
        simulator->Run(until);
        blocks = simulator->MinedBlocks();

        auto &primary = simulator->Primary();
        if (!options.output.empty()) {
          if (primary.SaveBlocks(options.output)) {
            LOG_INFO("Saved {} blocks to {}", primary.GetBlockCount(), options.output);
          } else {
            LOG_ERROR("Failed to save DAG to {}", options.output);
            exit_code = 1;
          }
        }

        if (options.test_pruning) {
          const auto pruning_point = primary.GetPruningPoint();
          LOG_INFO("Pruning point {} at blue score {}, {} blocks retained",
                   pruning_point.hash.ToShortString(), pruning_point.blue_score,
                   primary.GetBlockCount());
          simulator->Shutdown();
          util::LogManager::Shutdown();
          return exit_code;
        }
        simulator->Shutdown();
      }

      // Benchmark DAG validation on a fresh archival consensus
      consensus::ConsensusConfig config;
      config.processing_threads = options.processors_threads;
      config.monitor_interval_ms = 1000;
      config.enable_pruning = false;
      consensus::Consensus validator(*params, config);

      if (!sim::ValidateDag(validator, blocks)) {
        LOG_ERROR("DAG validation failed");
        exit_code = 1;
      }

      const auto stats = sim::ComputeDagStats(validator, blocks);
      const auto &consensus_params = params->GetConsensus();
      LOG_INFO("[DELAY={}, BPS={}, GHOSTDAG K={}]", options.delay, options.bps,
               consensus_params.ghostdagK);
      LOG_INFO("[Average stats of generated DAG] blues: {:.3f}, reds: {:.3f}, parents: {:.3f}, "
               "txs: {:.3f}",
               stats.blues_mean, stats.reds_mean, stats.parents_mean, stats.txs_mean);
      LOG_INFO("{}", validator.GetCountersSnapshot().ToString());

      validator.Shutdown();
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    blockdag::util::LogManager::Shutdown();
    return 1;
  }
}
