#pragma once

#include "psync/storage/backend.hpp"
#include "psync/transfer/engine.hpp"

#include <cstddef>
#include <regex>
#include <string>

namespace psync::transfer {

struct CopyOptions {
    std::size_t threads = 1;                 // clamped to [1, kMaxWorkers]
    const std::regex* include = nullptr;
    const std::regex* exclude = nullptr;
    bool dry_run = false;
    bool no_progress = false;
    bool preserve_times = true;
};

/**
 * @brief Copy a tree (or a single file) from one backend to another
 *
 * The calling thread walks `source_path` and queues every regular file
 * and symlink that passes the filters; `options.threads` workers drain the
 * queue. When both backends are local, files go through the FastCopier
 * and symlinks are recreated with their verbatim target. Otherwise each
 * file is moved with source.get + dest.put, and symlinks are skipped
 * since the backend API has no way to recreate them.
 *
 * A file root is copied to `dest_path` itself. Per-item failures do not
 * stop the run; they are folded into Other("<n> errors occurred during copy").
 *
 * RETURNS: NotFound if `source_path` does not exist, Other when no worker
 *          thread could be started
 */
Status copy(const storage::StorageBackend& source, const std::string& source_path,
            const storage::StorageBackend& dest, const std::string& dest_path,
            const CopyOptions& options, const EngineContext& context = {});

} // namespace psync::transfer
