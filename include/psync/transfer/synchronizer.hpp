#pragma once

#include "psync/storage/backend.hpp"
#include "psync/transfer/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <regex>
#include <vector>

namespace psync::transfer {

/**
 * @brief One entry scheduled by Synchronizer::files_to_sync
 */
struct SyncItem {
    std::filesystem::path path;                      // absolute source path
    std::uint64_t size = 0;                          // 0 for directories
    storage::EntryKind kind = storage::EntryKind::File;
};

struct SynchronizerOptions {
    std::size_t threads = 1;                 // clamped to [1, kMaxWorkers]
    bool dry_run = false;
    bool no_progress = false;
};

/**
 * @brief Hash-verified sync between any Source and Sink
 *
 * Unlike the chunked engine this works at whole-file granularity and only
 * needs the narrow Source/Sink capabilities, so it also covers empty
 * directories and symlinks.
 *
 * EXAMPLE:
 * storage::LocalSource source;
 * storage::LocalSink sink;
 * Synchronizer synchronizer(source, sink);
 * auto items = synchronizer.files_to_sync(src, dst, nullptr, nullptr, true);
 * auto status = synchronizer.sync_files(items, src, dst, {4});
 */
class Synchronizer {
public:
    Synchronizer(const storage::Source& source, const storage::Sink& sink) : source_(source), sink_(sink) {}

    /**
     * @brief Files, symlinks and empty directories below `source_root` that need transferring
     *
     * Links are not followed. With `verify` set, a regular file whose
     * destination digest equals its source digest is left out.
     *
     * RETURNS: Items ordered largest first, so big files start early
     */
    std::vector<SyncItem> files_to_sync(const std::filesystem::path& source_root,
                                        const std::filesystem::path& dest_root,
                                        const std::regex* include,
                                        const std::regex* exclude,
                                        bool verify) const;

    /**
     * @brief Transfer `items` with `options.threads` workers
     *
     * Workers claim items through a shared atomic cursor. Failures are
     * collected and folded into Other("<n> errors occurred during synchronize").
     */
    Status sync_files(const std::vector<SyncItem>& items,
                      const std::filesystem::path& source_root,
                      const std::filesystem::path& dest_root,
                      const SynchronizerOptions& options,
                      const EngineContext& context = {}) const;

private:
    const storage::Source& source_;
    const storage::Sink& sink_;
};

} // namespace psync::transfer
