// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace bridgerelay {
namespace util {

/**
 * Durable tail rewrite for append-only logs
 *
 * Pattern:
 * 1. Open (create if missing) the file
 * 2. Truncate it to `keep_bytes`
 * 3. Write `data` at that offset (partial writes retried)
 * 4. fsync() the file, and the directory when the file was just created
 *
 * Bytes before `keep_bytes` are never touched. Returns false on any failure;
 * in that case the file may hold a partially written tail, which the next
 * successful call overwrites.
 */
bool truncate_and_append(const std::filesystem::path &path, uint64_t keep_bytes,
                         std::string_view data);

/**
 * Read entire file into string
 * Returns empty string on failure or for files larger than 100MB
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: ~/.bridge-relay
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace bridgerelay
