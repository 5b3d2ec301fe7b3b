#include "psync/core/file_descriptor.hpp"

#ifdef PSYNC_PLATFORM_POSIX

#include <cerrno>
#include <system_error>

namespace psync {
namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

} // namespace

FileDescriptor::~FileDescriptor() {
    close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = kInvalid;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = kInvalid;
    }
    return *this;
}

TransferResult<FileDescriptor> FileDescriptor::open(const std::filesystem::path& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd == kInvalid) {
        return Err<FileDescriptor>(TransferError::from_error_code(last_error(), path.string()));
    }
    return Ok<TransferError>(FileDescriptor(fd));
}

TransferResult<std::size_t> FileDescriptor::read_at(char* buffer, std::size_t length, std::uint64_t offset) const {
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pread(fd_, buffer + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<std::size_t>(TransferError::io("pread failed", last_error()));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return Ok<TransferError>(total);
}

Status FileDescriptor::write_at(const char* buffer, std::size_t length, std::uint64_t offset) const {
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pwrite(fd_, buffer + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(TransferError::io("pwrite failed", last_error()));
        }
        total += static_cast<std::size_t>(n);
    }
    return Ok<TransferError>();
}

Status FileDescriptor::reset() const {
    if (::ftruncate(fd_, 0) != 0) {
        return Err<void>(TransferError::io("ftruncate failed", last_error()));
    }
    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        return Err<void>(TransferError::io("lseek failed", last_error()));
    }
    return Ok<TransferError>();
}

void FileDescriptor::close() {
    if (fd_ != kInvalid) {
        ::close(fd_);
        fd_ = kInvalid;
    }
}

} // namespace psync

#endif
