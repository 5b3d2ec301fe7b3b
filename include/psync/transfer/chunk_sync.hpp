/**
 * @file chunk_sync.hpp
 * @brief Incremental tree sync that rewrites only the chunks that changed
 *
 * FLOW:
 * 1. Discovery: walk the source, mirror directories, record files + total bytes
 * 2. Producer: skip files whose size and mtime match exactly, copy new or
 *    small files whole, split large existing files into chunk jobs
 * 3. Workers: Adler-32 the source and destination range of each chunk and
 *    write the source bytes at that offset only when they differ
 */

#pragma once

#include "psync/storage/backend.hpp"
#include "psync/transfer/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace psync::transfer {

constexpr std::size_t kDefaultChunkSize = std::size_t{1} << 20;
constexpr std::uint64_t kLargeFileThreshold = std::uint64_t{32} << 20;
// Largest accepted chunk size; each worker holds two buffers of this size
constexpr std::size_t kMaxChunkSize = std::size_t{1} << 30;

struct SyncOptions {
    std::size_t threads = 2;                 // clamped to [1, kMaxWorkers]
    std::size_t chunk_size = kDefaultChunkSize;
    std::uint64_t large_file_threshold = kLargeFileThreshold;   // below: always copied whole
    bool no_progress = false;
    bool dry_run = false;
    bool preserve_times = true;
};

/**
 * @brief Make `dest_root` mirror `source_root`
 *
 * Symlinks and special files are skipped. Files are compared by exact size
 * and modification time equality, so a file copied by an earlier run (which
 * carried the mtime over) is not read again. A destination larger than the
 * source is truncated before chunk comparison.
 *
 * Chunking needs random access and is only done when both backends are
 * local; otherwise changed files are moved whole with get + put.
 *
 * RETURNS: NotFound if `source_root` does not exist, Other for a chunk
 *          size of 0 or above kMaxChunkSize, Other("<n> errors occurred during sync") when items failed
 */
Status sync(const storage::StorageBackend& source, const std::string& source_root,
            const storage::StorageBackend& dest, const std::string& dest_root,
            const SyncOptions& options, const EngineContext& context = {});

/// zlib Adler-32 of one buffer
std::uint32_t adler32_checksum(const char* data, std::size_t length);

} // namespace psync::transfer
