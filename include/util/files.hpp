// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace draftops {
namespace util {

/**
 * Write text to file atomically (crash-safe state export)
 *
 * Writes <path>.tmp.<random>, fsyncs it and the directory, then renames it
 * over the target, so readers see either the old file or the new one.
 * @param mode File permissions for the new file (default 0644)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file is missing, unreadable or over 16MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.draftops (falls back to ./.draftops without HOME)
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace draftops
