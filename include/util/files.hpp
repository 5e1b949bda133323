// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace devicelink {
namespace util {

/**
 * Crash-safe file replacement used by the inventory store
 *
 * Write to "<path>.tmp.<rand>", fsync the file and its directory, then rename
 * over the target. A reader sees either the old file or the new one, never a
 * partial write.
 */

/**
 * Write string to file atomically
 * Returns true on success, false on failure (temp file is removed)
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns empty string on failure or oversize file
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

// ~/.devicelink, or ./.devicelink when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace devicelink
