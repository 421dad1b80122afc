#pragma once

#include <cstddef>
#include <cstdint>

namespace blockdag {
namespace protocol {

// Protocol version - increment when the sync flow contracts change
constexpr uint32_t PROTOCOL_VERSION = 5;

// Message commands
namespace commands {
// Anticone sync
constexpr const char *REQUEST_ANTICONE = "reqanticone";
constexpr const char *BLOCK_HEADERS = "blockheaders";
constexpr const char *DONE_HEADERS = "doneheaders";

// Pruning point query
constexpr const char *REQUEST_PRUNING_POINT = "reqpp";
constexpr const char *PRUNING_POINT = "pruningpoint";
} // namespace commands

// Anticone requests are bounded by the mergeset size limit times this
// factor (slack for DAG growth while the requester syncs)
constexpr size_t ANTICONE_LIMIT_FACTOR = 2;

// Worker threads for blocking consensus queries issued by sync flows
constexpr size_t DEFAULT_SYNC_BLOCKING_THREADS = 2;

} // namespace protocol
} // namespace blockdag
