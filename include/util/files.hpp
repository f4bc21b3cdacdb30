// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace blockledger {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. fsync() the directory so the rename is durable
 * 4. Atomic rename over original file
 *
 * Either the old file or the new file is always on disk, never a
 * half-written one.
 */

/**
 * Write string to file atomically
 * @param mode File permissions (e.g., 0600 for owner-only)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file cannot be opened or read, or is larger
 * than 256MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: ~/.blockledger
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace blockledger
