#pragma once

#include "psync/core/error.hpp"
#include "psync/core/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace psync {

#ifdef PSYNC_PLATFORM_POSIX

/**
 * @brief Move-only owner of a POSIX file descriptor
 */
class FileDescriptor {
public:
    static constexpr int kInvalid = -1;

    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    /**
     * @brief open(2) wrapper, O_CLOEXEC is always added
     */
    static TransferResult<FileDescriptor> open(const std::filesystem::path& path, int flags, mode_t mode = 0644);

    /**
     * @brief Read up to `length` bytes at `offset`, retrying short reads until EOF
     *
     * RETURNS: Bytes read (less than length only at end of file)
     */
    TransferResult<std::size_t> read_at(char* buffer, std::size_t length, std::uint64_t offset) const;

    /**
     * @brief Write all of `buffer` at `offset`
     */
    Status write_at(const char* buffer, std::size_t length, std::uint64_t offset) const;

    /**
     * @brief Truncate to zero length and rewind the file position
     */
    Status reset() const;

    void close();
    bool is_valid() const { return fd_ != kInvalid; }
    int native_handle() const { return fd_; }

private:
    int fd_ = kInvalid;
};

#endif

} // namespace psync
