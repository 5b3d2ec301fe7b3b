#pragma once

#include "psync/core/error.hpp"
#include "psync/storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace psync::storage {

/**
 * @brief Whole-backend operations over one storage medium
 *
 * Implementations must be safe to call from many worker threads at once.
 *
 * Contract:
 * - list:   entries directly under `path`, no side effects
 * - stat:   metadata of `path` itself, links are not followed
 * - get:    full contents of a file
 * - put:    write a file, creating missing parent directories
 * - remove: delete a file, link, or directory (recursively)
 * - exists: whether `path` exists (a dangling link exists)
 *
 * Failures: NotFound when the path is absent, Io for I/O faults, Other for
 * backend specific faults.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual TransferResult<std::vector<FileEntry>> list(const std::string& path) const = 0;
    virtual TransferResult<EntryMetadata> stat(const std::string& path) const = 0;
    virtual TransferResult<std::vector<std::uint8_t>> get(const std::string& path) const = 0;
    virtual Status put(const std::string& path, const std::vector<std::uint8_t>& data) const = 0;
    virtual Status remove(const std::string& path) const = 0;
    virtual TransferResult<bool> exists(const std::string& path) const = 0;

    [[nodiscard]] virtual Locality locality() const noexcept = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief True when both endpoints are plain local filesystems
 */
inline bool both_local(const StorageBackend& source, const StorageBackend& dest) noexcept {
    return source.locality() == Locality::Local && dest.locality() == Locality::Local;
}

/**
 * @brief Read side used by the Synchronizer
 */
class Source {
public:
    virtual ~Source() = default;

    /// Content digest, nullopt when the file cannot be read
    virtual std::optional<Digest> hash(const std::filesystem::path& path) const = 0;
    virtual TransferResult<std::vector<std::uint8_t>> read(const std::filesystem::path& path) const = 0;
    virtual bool is_symlink(const std::filesystem::path& path) const = 0;
    virtual TransferResult<std::filesystem::path> read_link(const std::filesystem::path& path) const = 0;
};

/**
 * @brief Write side used by the Synchronizer
 */
class Sink {
public:
    virtual ~Sink() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual std::optional<Digest> hash(const std::filesystem::path& path) const = 0;

    /// Write a whole file, creating parent directories as needed
    virtual Status write(const std::filesystem::path& path, const std::vector<std::uint8_t>& content) const = 0;

    /// Idempotent, recursive (mkdir -p)
    virtual Status create_dir(const std::filesystem::path& path) const = 0;

    /// Creates `link` pointing at `target` verbatim, replacing an existing link
    virtual Status create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) const = 0;

    virtual Status copy_from(const std::filesystem::path& source_path, const std::filesystem::path& dest_path) const = 0;
};

} // namespace psync::storage
