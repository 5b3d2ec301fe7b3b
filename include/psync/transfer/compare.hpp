#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace psync::transfer {

/**
 * @brief Differences between two local trees, as relative generic paths
 */
struct CompareReport {
    std::vector<std::string> missing;            // in source only
    std::vector<std::string> extra;              // in destination only
    std::vector<std::string> size_mismatch;
    std::vector<std::string> type_mismatch;
    std::vector<std::string> checksum_mismatch;  // includes files that could not be hashed

    [[nodiscard]] bool passed() const noexcept {
        return missing.empty() && extra.empty() && size_mismatch.empty() &&
               type_mismatch.empty() && checksum_mismatch.empty();
    }

    [[nodiscard]] std::size_t difference_count() const noexcept {
        return missing.size() + extra.size() + size_mismatch.size() +
               type_mismatch.size() + checksum_mismatch.size();
    }
};

/**
 * @brief Walk both trees (links not followed) and report every difference
 *
 * Each difference is also logged at warn level. Regular files present on
 * both sides are compared by content digest.
 */
CompareReport compare_dirs(const std::filesystem::path& source_root, const std::filesystem::path& dest_root);

} // namespace psync::transfer
