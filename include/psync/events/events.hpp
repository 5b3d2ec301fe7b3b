/**
 * @file events.hpp
 * @brief Event types emitted by the copy, delete and sync engines
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileCopiedEvent, PathDeletedEvent
 *
 * All events are emitted from worker threads, in no particular order
 * across workers.
 */

#pragma once

#include "psync/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace psync::events {

/**
 * @brief A whole file (or symlink) reached the destination
 *
 * WHO EMITS:
 * - Copy engine worker, sync producer (small/new files), synchronizer
 */
struct FileCopiedEvent {
    std::string source_path;
    std::string dest_path;
    std::uint64_t bytes = 0;
    std::string method;  // copy tier name, "get/put", "symlink" or "sink"
};

/**
 * @brief A file was left untouched because the destination already matched
 *
 * WHO EMITS:
 * - Sync producer (size + mtime short-circuit)
 * - Synchronizer (hash match)
 */
struct FileSkippedEvent {
    std::string source_path;
    std::string dest_path;
    std::uint64_t bytes = 0;
    std::string reason;
};

/**
 * @brief A chunk differed and was written into the destination at its offset
 */
struct ChunkRewrittenEvent {
    std::string dest_path;
    std::size_t chunk_index = 0;
    std::uint64_t offset = 0;
    std::size_t bytes = 0;
};

/**
 * @brief A chunk's checksum and length matched, nothing was written
 */
struct ChunkMatchedEvent {
    std::string dest_path;
    std::size_t chunk_index = 0;
    std::uint64_t offset = 0;
    std::size_t bytes = 0;
};

struct PathDeletedEvent {
    std::string path;
    bool is_directory = false;
};

/**
 * @brief A single item failed; the engine keeps going
 */
struct TransferFailedEvent {
    std::string operation;  // "copy", "delete", "sync"
    std::string path;
    TransferError error;
};

/**
 * @brief An engine invocation returned
 */
struct OperationCompletedEvent {
    std::string operation;
    std::size_t failures = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace psync::events
