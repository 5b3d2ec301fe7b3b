#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace psync::storage {

enum class EntryKind {
    File,
    Directory,
    Symlink,
    Other   // sockets, fifos, devices: never transferred
};

/**
 * @brief Backend-reported metadata of a single entry
 *
 * For symlinks `size` is the length of the link target and `modified`
 * is left empty (the link is never followed).
 */
struct EntryMetadata {
    EntryKind kind = EntryKind::Other;
    std::uint64_t size = 0;
    std::optional<std::filesystem::file_time_type> modified;

    bool is_file() const noexcept { return kind == EntryKind::File; }
    bool is_directory() const noexcept { return kind == EntryKind::Directory; }
    bool is_symlink() const noexcept { return kind == EntryKind::Symlink; }
};

struct FileEntry {
    std::string path;         ///< Full backend path of the entry
    EntryMetadata metadata;
};

/**
 * @brief Acceleration tag, queried once per engine invocation
 *
 * Only when both endpoints are Local may an engine bypass get/put and
 * use OS-level copy paths on the raw filesystem.
 */
enum class Locality {
    Local,
    Remote
};

/// Lowercase hex content digest
using Digest = std::string;

} // namespace psync::storage
