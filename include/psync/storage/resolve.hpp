#pragma once

#include "psync/storage/backend.hpp"

#include <memory>
#include <string>

namespace psync::storage {

struct ResolvedLocation {
    std::shared_ptr<StorageBackend> backend;
    std::string path;   ///< Backend-relative path with the scheme stripped
};

/**
 * @brief Map a user supplied location to a backend and path
 *
 * - "file:///data/x" -> local backend, "/data/x"
 * - "/data/x", "rel/dir" -> local backend, unchanged
 * - "<scheme>://..." -> Other("Unsupported protocol: <scheme>")
 * - "user@host:path" -> Other, no remote transport is built in
 */
TransferResult<ResolvedLocation> resolve_backend(const std::string& location);

} // namespace psync::storage
