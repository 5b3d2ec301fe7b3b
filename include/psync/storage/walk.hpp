#pragma once

#include "psync/storage/backend.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace psync::storage {

/// Called with every discovered entry and its depth below the root (root = 0)
using WalkVisitor = std::function<void(const FileEntry& entry, std::size_t depth)>;

/**
 * @brief Depth-first, pre-order traversal through StorageBackend::list
 *
 * The root itself is visited first. Symlinked directories are not
 * descended into. Directories that cannot be listed are logged and
 * skipped; a root that cannot be stat'ed yields no visits.
 */
void walk(const StorageBackend& backend, const std::string& root, const WalkVisitor& visit);

} // namespace psync::storage
