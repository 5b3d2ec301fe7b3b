/**
 * @file config.hpp
 * @brief Engine options shared by the CLI and library callers
 *
 * JSON FORMAT (every key optional, unknown keys ignored):
 * {
 *   "threads": 8,
 *   "include": "\\.txt$",
 *   "exclude": "/cache/",
 *   "dry_run": false,
 *   "no_progress": false,
 *   "preserve_times": true,
 *   "verify": true,
 *   "chunk_size": 1048576,
 *   "large_file_threshold": 33554432
 * }
 */

#pragma once

#include "psync/core/error.hpp"
#include "psync/transfer/chunk_sync.hpp"
#include "psync/transfer/copy_engine.hpp"
#include "psync/transfer/delete_engine.hpp"
#include "psync/transfer/synchronizer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>

namespace psync::config {

/// hardware_concurrency(), at least 1
std::size_t default_thread_count();

struct EngineConfig {
    std::size_t threads = default_thread_count();
    std::string include;    // empty = no filter
    std::string exclude;    // empty = no filter
    bool dry_run = false;
    bool no_progress = false;
    bool preserve_times = true;
    bool verify = true;
    std::size_t chunk_size = transfer::kDefaultChunkSize;
    std::uint64_t large_file_threshold = transfer::kLargeFileThreshold;
};

/**
 * @brief Overlay the keys present in `json_text` onto `base`
 *
 * RETURNS: Other on malformed JSON or a wrongly typed key. Counts must be
 *          non-negative integers; threads and chunk_size must also be
 *          nonzero and at most kMaxWorkers and kMaxChunkSize
 */
TransferResult<EngineConfig> parse_config(const std::string& json_text, EngineConfig base = {});

/**
 * @brief parse_config over the contents of a file
 */
TransferResult<EngineConfig> load_config(const std::filesystem::path& path, EngineConfig base = {});

/// Pretty-printed JSON of every field
std::string to_json(const EngineConfig& config);

/**
 * @brief Compiled include/exclude patterns
 *
 * Engines take the patterns by pointer; keep the Filters alive for the
 * duration of the call.
 */
struct Filters {
    std::optional<std::regex> include;
    std::optional<std::regex> exclude;

    const std::regex* include_ptr() const { return include ? &*include : nullptr; }
    const std::regex* exclude_ptr() const { return exclude ? &*exclude : nullptr; }
};

/**
 * @brief RETURNS: Other("Invalid include pattern ...") for a bad regex
 */
TransferResult<Filters> compile_filters(const EngineConfig& config);

transfer::CopyOptions to_copy_options(const EngineConfig& config, const Filters& filters);
transfer::DeleteOptions to_delete_options(const EngineConfig& config, const Filters& filters);
transfer::SyncOptions to_sync_options(const EngineConfig& config);
transfer::SynchronizerOptions to_synchronizer_options(const EngineConfig& config);

} // namespace psync::config
