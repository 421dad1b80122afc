// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    blockdag::util::LogManager::Initialize(level, false, "");

    // "trace" also lowers every component logger so LOG_CHAIN_TRACE,
    // LOG_PIPE_TRACE, etc. all show up
    if (level == "trace") {
        for (const auto& component : blockdag::util::LogManager::Components()) {
            blockdag::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    blockdag::util::LogManager::Shutdown();
}
