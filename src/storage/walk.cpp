#include "psync/storage/walk.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace psync::storage {

void walk(const StorageBackend& backend, const std::string& root, const WalkVisitor& visit) {
    auto root_meta = backend.stat(root);
    if (root_meta.is_error()) {
        spdlog::warn("Cannot access {}: {}", root, root_meta.error().to_string());
        return;
    }

    // Explicit stack keeps deep trees off the call stack
    std::vector<std::pair<FileEntry, std::size_t>> pending;
    pending.emplace_back(FileEntry{root, root_meta.value()}, 0);

    while (!pending.empty()) {
        auto [entry, depth] = std::move(pending.back());
        pending.pop_back();

        visit(entry, depth);

        if (!entry.metadata.is_directory()) {
            continue;
        }

        auto children = backend.list(entry.path);
        if (children.is_error()) {
            spdlog::debug("Skipping unreadable directory {}: {}", entry.path, children.error().to_string());
            continue;
        }

        auto& listed = children.value();
        // Reverse so children pop in listing order
        for (auto it = listed.rbegin(); it != listed.rend(); ++it) {
            pending.emplace_back(std::move(*it), depth + 1);
        }
    }
}

} // namespace psync::storage
