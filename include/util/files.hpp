// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace equirelay {
namespace util {

/**
 * Crash-safe file replacement
 *
 * Writes to "<path>.tmp", fsyncs the file and its directory, then renames
 * over the target, so a reader sees either the old or the new contents.
 * Returns false on any failure and leaves the old file untouched.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Read an entire file. std::nullopt if it is missing or unreadable.
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory (recursively). True if it exists afterwards.
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.equirelay
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace equirelay
