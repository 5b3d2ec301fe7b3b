#include "psync/transfer/fast_copy.hpp"

#include "psync/core/file_descriptor.hpp"
#include "psync/storage/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>

#ifdef PSYNC_PLATFORM_LINUX
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/sendfile.h>
#endif

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

#ifdef PSYNC_PLATFORM_LINUX

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

struct OpenPair {
    FileDescriptor source;
    FileDescriptor destination;
};

TransferResult<OpenPair> open_pair(const CopyRequest& request) {
    auto source = FileDescriptor::open(request.source, O_RDONLY);
    if (source.is_error()) {
        return Err<OpenPair>(source.error());
    }
    auto destination = FileDescriptor::open(request.destination, O_WRONLY | O_CREAT | O_TRUNC);
    if (destination.is_error()) {
        return Err<OpenPair>(destination.error());
    }
    return Ok<TransferError>(OpenPair{std::move(source.value()), std::move(destination.value())});
}

/**
 * @brief Drives a kernel copy call until EOF or the expected size
 *
 * `step` returns what the syscall returned for a request of `want` bytes.
 */
template<typename Step>
TransferResult<TierResult> kernel_copy_loop(const char* what, std::uint64_t expected_size, Step step) {
    std::uint64_t copied = 0;
    while (expected_size == 0 || copied < expected_size) {
        const std::uint64_t remaining = expected_size == 0 ? kMaxKernelCopyChunk : expected_size - copied;
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kMaxKernelCopyChunk));
        const ssize_t n = step(want);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const auto code = last_error();
            if (copied == 0) {
                return Err<TierResult>(TransferError::io(std::string(what) + " failed", code));
            }
            spdlog::debug("{} stopped after {} bytes: {}", what, copied, code.message());
            return Ok<TransferError>(TierResult{copied, false});
        }
        if (n == 0) {
            break;
        }
        copied += static_cast<std::uint64_t>(n);
    }

    // Some filesystems report success but move nothing (procfs, cross-device
    // on older kernels); let a later tier handle those.
    if (copied == 0 && expected_size > 0) {
        return Err<TierResult>(TransferError::io(std::string(what) + " copied no data"));
    }
    return Ok<TransferError>(TierResult{copied, true});
}

#endif

} // namespace

#ifdef PSYNC_PLATFORM_LINUX

TransferResult<TierResult> CloneTier::copy(const CopyRequest& request) const {
    auto files = open_pair(request);
    if (files.is_error()) {
        return Err<TierResult>(files.error());
    }
    auto& pair = files.value();

    if (::ioctl(pair.destination.native_handle(), FICLONE, pair.source.native_handle()) != 0) {
        return Err<TierResult>(TransferError::io("FICLONE failed", last_error()));
    }

    struct stat st {};
    if (::fstat(pair.source.native_handle(), &st) != 0) {
        return Err<TierResult>(TransferError::io("fstat failed", last_error()));
    }
    return Ok<TransferError>(TierResult{static_cast<std::uint64_t>(st.st_size), true});
}

TransferResult<TierResult> CopyFileRangeTier::copy(const CopyRequest& request) const {
    auto files = open_pair(request);
    if (files.is_error()) {
        return Err<TierResult>(files.error());
    }
    const int in = files.value().source.native_handle();
    const int out = files.value().destination.native_handle();

    return kernel_copy_loop("copy_file_range", request.expected_size, [in, out](std::size_t want) {
        return ::copy_file_range(in, nullptr, out, nullptr, want, 0);
    });
}

TransferResult<TierResult> SendfileTier::copy(const CopyRequest& request) const {
    auto files = open_pair(request);
    if (files.is_error()) {
        return Err<TierResult>(files.error());
    }
    if (auto reset = files.value().destination.reset(); reset.is_error()) {
        return Err<TierResult>(reset.error());
    }
    const int in = files.value().source.native_handle();
    const int out = files.value().destination.native_handle();

    return kernel_copy_loop("sendfile", request.expected_size, [in, out](std::size_t want) {
        return ::sendfile(out, in, nullptr, want);
    });
}

#endif

TransferResult<TierResult> WholeFileTier::copy(const CopyRequest& request) const {
    std::error_code ec;
    fs::copy_file(request.source, request.destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<TierResult>(TransferError::from_error_code(ec, request.source.string()));
    }
    const auto size = fs::file_size(request.destination, ec);
    if (ec) {
        return Err<TierResult>(TransferError::from_error_code(ec, request.destination.string()));
    }
    return Ok<TransferError>(TierResult{size, true});
}

TransferResult<TierResult> StreamingTier::copy(const CopyRequest& request) const {
    if (request.buffer.size() < storage::LocalBackend::kStreamBufferSize) {
        request.buffer.resize(storage::LocalBackend::kStreamBufferSize);
    }
    auto copied = storage::LocalBackend::copy_file(request.source, request.destination, request.buffer);
    if (copied.is_error()) {
        return Err<TierResult>(copied.error());
    }
    return Ok<TransferError>(TierResult{copied.value(), true});
}

std::vector<std::unique_ptr<CopyTier>> default_copy_tiers() {
    std::vector<std::unique_ptr<CopyTier>> tiers;
#ifdef PSYNC_PLATFORM_LINUX
    tiers.push_back(std::make_unique<CloneTier>());
    tiers.push_back(std::make_unique<CopyFileRangeTier>());
    tiers.push_back(std::make_unique<SendfileTier>());
#endif
    tiers.push_back(std::make_unique<WholeFileTier>());
    tiers.push_back(std::make_unique<StreamingTier>());
    return tiers;
}

FastCopier::FastCopier() : tiers_(default_copy_tiers()) {}

FastCopier::FastCopier(std::vector<std::unique_ptr<CopyTier>> tiers) : tiers_(std::move(tiers)) {}

const FastCopier& FastCopier::shared() {
    static const FastCopier copier;
    return copier;
}

TransferResult<CopyOutcome> FastCopier::copy(const fs::path& source,
                                             const fs::path& destination,
                                             std::uint64_t expected_size,
                                             const std::optional<fs::file_time_type>& source_modified,
                                             bool preserve_times,
                                             std::vector<char>& buffer) const {
    const CopyRequest request{source, destination, expected_size, buffer};
    bool destination_touched = false;
    std::optional<TransferError> failure;

    for (const auto& tier : tiers_) {
        if (destination_touched && tier->requires_untouched_destination()) {
            continue;
        }

        auto result = tier->copy(request);
        if (result.is_error()) {
            spdlog::debug("{} failed for {}: {}", tier->name(), source.string(), result.error().to_string());
            failure = result.error();
            continue;
        }
        if (!result.value().complete) {
            destination_touched = true;
            failure = TransferError::io(std::string(tier->name()) + " copied only part of " + source.string());
            continue;
        }

        if (preserve_times && source_modified) {
            std::error_code ec;
            fs::last_write_time(destination, *source_modified, ec);
            if (ec) {
                spdlog::debug("Could not set mtime on {}: {}", destination.string(), ec.message());
            }
        }
        return Ok<TransferError>(CopyOutcome{result.value().bytes, tier->name()});
    }

    if (!failure) {
        return Err<CopyOutcome>(TransferError::other("No copy method available for " + source.string()));
    }
    return Err<CopyOutcome>(*failure);
}

} // namespace psync::transfer
