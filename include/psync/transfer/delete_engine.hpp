#pragma once

#include "psync/storage/backend.hpp"
#include "psync/transfer/engine.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace psync::transfer {

struct DeleteOptions {
    std::size_t threads = 1;                 // clamped to [1, kMaxWorkers]
    bool dry_run = false;
    bool no_progress = false;
    const std::regex* include = nullptr;
    const std::regex* exclude = nullptr;
};

/**
 * @brief Remove every entry below each root in `paths`, roots included
 *
 * A counting pass sizes the progress total (in items). The producer then
 * walks each root in order: non-directories are queued as found, and once
 * the root is exhausted its directories are queued deepest first, so a
 * directory is normally already empty when a worker reaches it.
 *
 * With include/exclude set, directories that still hold a filtered-out
 * entry are left in place.
 *
 * Entries that vanish before their worker gets to them (removed along with
 * an ancestor) count as deleted.
 */
Status remove_tree(const storage::StorageBackend& backend, const std::vector<std::string>& paths,
                   const DeleteOptions& options, const EngineContext& context = {});

} // namespace psync::transfer
