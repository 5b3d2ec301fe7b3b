#pragma once

#include "psync/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace psync::storage {

/**
 * @brief StorageBackend over the local filesystem
 *
 * Stateless; one instance may be shared by every worker thread.
 */
class LocalBackend final : public StorageBackend {
public:
    TransferResult<std::vector<FileEntry>> list(const std::string& path) const override;
    TransferResult<EntryMetadata> stat(const std::string& path) const override;
    TransferResult<std::vector<std::uint8_t>> get(const std::string& path) const override;
    Status put(const std::string& path, const std::vector<std::uint8_t>& data) const override;
    Status remove(const std::string& path) const override;
    TransferResult<bool> exists(const std::string& path) const override;

    Locality locality() const noexcept override { return Locality::Local; }
    std::string name() const override { return "local"; }

    /**
     * @brief Portable streaming copy through a caller-owned buffer
     *
     * Creates or truncates `destination`. An empty buffer is grown to
     * kStreamBufferSize.
     *
     * RETURNS: Bytes copied
     */
    static TransferResult<std::uint64_t> copy_file(const std::filesystem::path& source,
                                                   const std::filesystem::path& destination,
                                                   std::vector<char>& buffer);

    static constexpr std::size_t kStreamBufferSize = 1 << 20;

    /// Metadata of `path` without following links
    static TransferResult<EntryMetadata> metadata_of(const std::filesystem::path& path);
};

/**
 * @brief Local read side for the Synchronizer
 */
class LocalSource final : public Source {
public:
    std::optional<Digest> hash(const std::filesystem::path& path) const override;
    TransferResult<std::vector<std::uint8_t>> read(const std::filesystem::path& path) const override;
    bool is_symlink(const std::filesystem::path& path) const override;
    TransferResult<std::filesystem::path> read_link(const std::filesystem::path& path) const override;
};

/**
 * @brief Local write side for the Synchronizer
 *
 * copy_from goes through the default fast-copy chain and keeps the
 * source modification time.
 */
class LocalSink final : public Sink {
public:
    bool exists(const std::filesystem::path& path) const override;
    std::optional<Digest> hash(const std::filesystem::path& path) const override;
    Status write(const std::filesystem::path& path, const std::vector<std::uint8_t>& content) const override;
    Status create_dir(const std::filesystem::path& path) const override;
    Status create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) const override;
    Status copy_from(const std::filesystem::path& source_path, const std::filesystem::path& dest_path) const override;
};

/**
 * @brief mkdir -p on the parent of `path`
 */
Status ensure_parent_exists(const std::filesystem::path& path);

} // namespace psync::storage
