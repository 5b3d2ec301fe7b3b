/**
 * @file fast_copy.hpp
 * @brief Tiered single-file copy for two local paths
 *
 * Tiers are tried in order, first success wins:
 *   1. CloneTier          FICLONE reflink, no data moved (Linux)
 *   2. CopyFileRangeTier  in-kernel copy, at most 1 GiB per call (Linux)
 *   3. SendfileTier       zero-copy send loop, only on an untouched destination (Linux)
 *   4. WholeFileTier      std::filesystem::copy_file, overwrite
 *   5. StreamingTier      read/write through the worker's reusable buffer
 *
 * The destination is created or truncated by whichever tier wins.
 */

#pragma once

#include "psync/core/error.hpp"
#include "psync/core/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace psync::transfer {

constexpr std::size_t kMaxKernelCopyChunk = std::size_t{1} << 30;

struct CopyRequest {
    const std::filesystem::path& source;
    const std::filesystem::path& destination;
    std::uint64_t expected_size;
    std::vector<char>& buffer;   // worker-owned, may be grown by a tier
};

/**
 * @brief Result of one tier attempt
 *
 * complete == false means bytes were written before the tier gave up; the
 * copier moves on but the destination is no longer pristine.
 */
struct TierResult {
    std::uint64_t bytes = 0;
    bool complete = true;
};

class CopyTier {
public:
    virtual ~CopyTier() = default;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /// Skip this tier once an earlier tier wrote a partial destination
    [[nodiscard]] virtual bool requires_untouched_destination() const noexcept { return false; }

    virtual TransferResult<TierResult> copy(const CopyRequest& request) const = 0;
};

#ifdef PSYNC_PLATFORM_LINUX

class CloneTier final : public CopyTier {
public:
    const char* name() const noexcept override { return "reflink"; }
    TransferResult<TierResult> copy(const CopyRequest& request) const override;
};

class CopyFileRangeTier final : public CopyTier {
public:
    const char* name() const noexcept override { return "copy_file_range"; }
    TransferResult<TierResult> copy(const CopyRequest& request) const override;
};

class SendfileTier final : public CopyTier {
public:
    const char* name() const noexcept override { return "sendfile"; }
    bool requires_untouched_destination() const noexcept override { return true; }
    TransferResult<TierResult> copy(const CopyRequest& request) const override;
};

#endif

class WholeFileTier final : public CopyTier {
public:
    const char* name() const noexcept override { return "copy_file"; }
    TransferResult<TierResult> copy(const CopyRequest& request) const override;
};

class StreamingTier final : public CopyTier {
public:
    const char* name() const noexcept override { return "stream"; }
    TransferResult<TierResult> copy(const CopyRequest& request) const override;
};

/// Platform default chain, see file comment
std::vector<std::unique_ptr<CopyTier>> default_copy_tiers();

struct CopyOutcome {
    std::uint64_t bytes = 0;
    const char* method = "";   // name() of the winning tier
};

/**
 * @brief Runs a chain of CopyTiers for one source/destination pair
 *
 * Immutable after construction and safe to share between workers.
 */
class FastCopier {
public:
    FastCopier();
    explicit FastCopier(std::vector<std::unique_ptr<CopyTier>> tiers);

    /**
     * @brief Copy `source` onto `destination`
     *
     * The parent of `destination` must exist. Intermediate tier failures
     * are only logged at debug; if every tier fails, the last error is
     * returned. On success with `preserve_times` set and a known
     * `source_modified`, the destination mtime is set to it (best effort).
     */
    TransferResult<CopyOutcome> copy(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     std::uint64_t expected_size,
                                     const std::optional<std::filesystem::file_time_type>& source_modified,
                                     bool preserve_times,
                                     std::vector<char>& buffer) const;

    [[nodiscard]] std::size_t tier_count() const noexcept { return tiers_.size(); }

    /// Process-wide copier over default_copy_tiers()
    static const FastCopier& shared();

private:
    std::vector<std::unique_ptr<CopyTier>> tiers_;
};

} // namespace psync::transfer
