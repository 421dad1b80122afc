#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace blockdag {
namespace util {

/**
 * Crash-safe file replacement for DAG exports
 *
 * Pattern:
 * 1. Write to a temporary sibling (.tmp.<random> suffix)
 * 2. fsync() the file, then its directory
 * 3. rename() over the target
 *
 * Readers see either the old export or the new one, never a torn file.
 */

/**
 * Write string to file atomically (mode 0644)
 * Returns true on success, false on failure (temp file removed)
 */
bool atomic_write_file(const std::filesystem::path &path, const std::string &data);

/**
 * Read entire file into string
 * Returns std::nullopt if the file is missing, unreadable or larger than
 * max_size bytes
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path,
                                            uintmax_t max_size = 1ULL << 30);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace blockdag
