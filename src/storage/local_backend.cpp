#include "psync/storage/local_backend.hpp"

#include "psync/storage/digest.hpp"
#include "psync/transfer/fast_copy.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>

namespace psync::storage {
namespace fs = std::filesystem;

namespace {

constexpr int kRemoveAttempts = 3;

EntryKind kind_of(const fs::file_status& status) {
    switch (status.type()) {
        case fs::file_type::regular: return EntryKind::File;
        case fs::file_type::directory: return EntryKind::Directory;
        case fs::file_type::symlink: return EntryKind::Symlink;
        default: return EntryKind::Other;
    }
}

Status write_bytes(const fs::path& path, const std::vector<std::uint8_t>& data) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(TransferError::io("Failed to open for writing: " + path.string()));
    }
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!output) {
        return Err<void>(TransferError::io("Failed to write: " + path.string()));
    }
    return Ok<TransferError>();
}

TransferResult<std::vector<std::uint8_t>> read_bytes(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Err<std::vector<std::uint8_t>>(TransferError::not_found(path.string()));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(TransferError::io("Failed to open for reading: " + path.string()));
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(TransferError::io("Failed to read: " + path.string()));
    }
    return Ok<TransferError>(std::move(data));
}

} // namespace

Status ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok<TransferError>();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(TransferError::from_error_code(ec, parent.string()));
    }
    return Ok<TransferError>();
}

TransferResult<EntryMetadata> LocalBackend::metadata_of(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Err<EntryMetadata>(TransferError::not_found(path.string()));
    }
    if (ec) {
        return Err<EntryMetadata>(TransferError::from_error_code(ec, path.string()));
    }

    EntryMetadata metadata;
    metadata.kind = kind_of(status);

    switch (metadata.kind) {
        case EntryKind::File: {
            const auto size = fs::file_size(path, ec);
            if (ec) {
                return Err<EntryMetadata>(TransferError::from_error_code(ec, path.string()));
            }
            metadata.size = size;
            const auto modified = fs::last_write_time(path, ec);
            if (!ec) {
                metadata.modified = modified;
            }
            break;
        }
        case EntryKind::Symlink: {
            const auto target = fs::read_symlink(path, ec);
            if (!ec) {
                metadata.size = target.native().size();
            }
            break;
        }
        case EntryKind::Directory: {
            const auto modified = fs::last_write_time(path, ec);
            if (!ec) {
                metadata.modified = modified;
            }
            break;
        }
        case EntryKind::Other:
            break;
    }

    return Ok<TransferError>(metadata);
}

TransferResult<std::vector<FileEntry>> LocalBackend::list(const std::string& path) const {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return Err<std::vector<FileEntry>>(TransferError::from_error_code(ec, path));
    }

    std::vector<FileEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        auto metadata = metadata_of(it->path());
        if (metadata.is_error()) {
            // Vanished or unreadable between readdir and stat
            spdlog::debug("Skipping {}: {}", it->path().string(), metadata.error().to_string());
            continue;
        }
        entries.push_back(FileEntry{it->path().string(), metadata.value()});
    }
    if (ec) {
        return Err<std::vector<FileEntry>>(TransferError::from_error_code(ec, path));
    }

    return Ok<TransferError>(std::move(entries));
}

TransferResult<EntryMetadata> LocalBackend::stat(const std::string& path) const {
    return metadata_of(path);
}

TransferResult<std::vector<std::uint8_t>> LocalBackend::get(const std::string& path) const {
    return read_bytes(path);
}

Status LocalBackend::put(const std::string& path, const std::vector<std::uint8_t>& data) const {
    return write_bytes(path, data);
}

Status LocalBackend::remove(const std::string& path) const {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Err<void>(TransferError::not_found(path));
    }
    if (ec) {
        return Err<void>(TransferError::from_error_code(ec, path));
    }

    if (status.type() != fs::file_type::directory) {
        fs::remove(path, ec);
        if (ec) {
            return Err<void>(TransferError::from_error_code(ec, path));
        }
        return Ok<TransferError>();
    }

    // Entries below may be removed concurrently by other workers, which
    // makes remove_all trip over ENOENT half way through. Retry while the
    // directory itself is still there.
    for (int attempt = 1; attempt <= kRemoveAttempts; ++attempt) {
        ec.clear();
        fs::remove_all(path, ec);
        if (!ec) {
            return Ok<TransferError>();
        }
        std::error_code gone_ec;
        if (!fs::exists(fs::symlink_status(path, gone_ec))) {
            return Ok<TransferError>();
        }
        if (ec.value() != ENOENT && ec.value() != ENOTEMPTY) {
            break;
        }
        spdlog::debug("remove_all {} raced with another worker (attempt {})", path, attempt);
    }
    return Err<void>(TransferError::from_error_code(ec, path));
}

TransferResult<bool> LocalBackend::exists(const std::string& path) const {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Ok<TransferError>(false);
    }
    if (ec) {
        return Err<bool>(TransferError::from_error_code(ec, path));
    }
    return Ok<TransferError>(true);
}

TransferResult<std::uint64_t> LocalBackend::copy_file(const fs::path& source,
                                                      const fs::path& destination,
                                                      std::vector<char>& buffer) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        std::error_code ec;
        if (!fs::exists(source, ec)) {
            return Err<std::uint64_t>(TransferError::not_found(source.string()));
        }
        return Err<std::uint64_t>(TransferError::io("Failed to open for reading: " + source.string()));
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<std::uint64_t>(TransferError::io("Failed to open for writing: " + destination.string()));
    }

    if (buffer.empty()) {
        buffer.resize(kStreamBufferSize);
    }

    std::uint64_t copied = 0;
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = input.gcount();
        output.write(buffer.data(), count);
        if (!output) {
            return Err<std::uint64_t>(TransferError::io("Failed to write: " + destination.string()));
        }
        copied += static_cast<std::uint64_t>(count);
    }
    if (input.bad()) {
        return Err<std::uint64_t>(TransferError::io("Failed to read: " + source.string()));
    }

    output.flush();
    if (!output) {
        return Err<std::uint64_t>(TransferError::io("Failed to flush: " + destination.string()));
    }
    return Ok<TransferError>(copied);
}

// ---------------------------------------------------------------------------
// LocalSource
// ---------------------------------------------------------------------------

std::optional<Digest> LocalSource::hash(const fs::path& path) const {
    return hash_file(path);
}

TransferResult<std::vector<std::uint8_t>> LocalSource::read(const fs::path& path) const {
    return read_bytes(path);
}

bool LocalSource::is_symlink(const fs::path& path) const {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

TransferResult<fs::path> LocalSource::read_link(const fs::path& path) const {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) {
        return Err<fs::path>(TransferError::from_error_code(ec, path.string()));
    }
    return Ok<TransferError>(std::move(target));
}

// ---------------------------------------------------------------------------
// LocalSink
// ---------------------------------------------------------------------------

bool LocalSink::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

std::optional<Digest> LocalSink::hash(const fs::path& path) const {
    return hash_file(path);
}

Status LocalSink::write(const fs::path& path, const std::vector<std::uint8_t>& content) const {
    return write_bytes(path, content);
}

Status LocalSink::create_dir(const fs::path& path) const {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::is_directory(path)) {
        return Err<void>(TransferError::from_error_code(ec, path.string()));
    }
    return Ok<TransferError>();
}

Status LocalSink::create_symlink(const fs::path& target, const fs::path& link) const {
    if (auto res = ensure_parent_exists(link); res.is_error()) {
        return res;
    }

    std::error_code ec;
    const auto status = fs::symlink_status(link, ec);
    if (fs::exists(status)) {
        fs::remove(link, ec);
        if (ec) {
            return Err<void>(TransferError::from_error_code(ec, link.string()));
        }
    }

    fs::create_symlink(target, link, ec);
    if (ec) {
        return Err<void>(TransferError::from_error_code(ec, link.string()));
    }
    return Ok<TransferError>();
}

Status LocalSink::copy_from(const fs::path& source_path, const fs::path& dest_path) const {
    if (auto res = ensure_parent_exists(dest_path); res.is_error()) {
        return res;
    }

    auto metadata = LocalBackend::metadata_of(source_path);
    if (metadata.is_error()) {
        return Err<void>(metadata.error());
    }

    std::vector<char> buffer;
    const auto& copier = transfer::FastCopier::shared();
    auto copied = copier.copy(source_path, dest_path, metadata.value().size,
                              metadata.value().modified, true, buffer);
    if (copied.is_error()) {
        return Err<void>(copied.error());
    }
    return Ok<TransferError>();
}

} // namespace psync::storage
