#include "psync/transfer/compare.hpp"

#include "psync/core/format.hpp"
#include "psync/storage/digest.hpp"
#include "psync/storage/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

std::set<std::string> relative_entries(const fs::path& root) {
    std::set<std::string> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        entries.insert(it->path().lexically_relative(root).generic_string());
    }
    if (ec) {
        spdlog::warn("Could not fully walk {}: {}", root.string(), ec.message());
    }
    return entries;
}

const char* kind_name(storage::EntryKind kind) {
    switch (kind) {
        case storage::EntryKind::File: return "regular file";
        case storage::EntryKind::Directory: return "directory";
        case storage::EntryKind::Symlink: return "symlink";
        default: return "special file";
    }
}

void compare_entry(const std::string& relative, const fs::path& source_root, const fs::path& dest_root,
                   CompareReport& report) {
    const auto source_path = source_root / relative;
    const auto dest_path = dest_root / relative;

    auto source_meta = storage::LocalBackend::metadata_of(source_path);
    auto dest_meta = storage::LocalBackend::metadata_of(dest_path);
    if (source_meta.is_error() || dest_meta.is_error()) {
        return;
    }
    const auto& src = source_meta.value();
    const auto& dst = dest_meta.value();

    if (src.kind != dst.kind) {
        spdlog::warn("TYPE MISMATCH: {} (src: {}, dest: {})", relative, kind_name(src.kind), kind_name(dst.kind));
        report.type_mismatch.push_back(relative);
        return;
    }

    if (src.is_directory()) {
        return;
    }

    if (src.size != dst.size) {
        spdlog::warn("SIZE MISMATCH: {} (src: {}, dest: {})", relative,
                     human_readable_size(src.size), human_readable_size(dst.size));
        report.size_mismatch.push_back(relative);
    }

    if (!src.is_file()) {
        return;
    }

    const auto source_hash = storage::hash_file(source_path);
    const auto dest_hash = storage::hash_file(dest_path);
    if (!source_hash || !dest_hash) {
        spdlog::error("Hashing failed for src: {}, dest: {}", source_path.string(), dest_path.string());
        report.checksum_mismatch.push_back(relative);
        return;
    }
    if (*source_hash != *dest_hash) {
        spdlog::warn("CHECKSUM MISMATCH: {} (src: {}, dest: {})", relative, *source_hash, *dest_hash);
        report.checksum_mismatch.push_back(relative);
    }
}

} // namespace

CompareReport compare_dirs(const fs::path& source_root, const fs::path& dest_root) {
    const auto source_entries = relative_entries(source_root);
    const auto dest_entries = relative_entries(dest_root);

    CompareReport report;
    for (const auto& entry : source_entries) {
        if (dest_entries.count(entry) == 0) {
            spdlog::warn("MISSING in dest: {}", entry);
            report.missing.push_back(entry);
        } else {
            compare_entry(entry, source_root, dest_root, report);
        }
    }
    for (const auto& entry : dest_entries) {
        if (source_entries.count(entry) == 0) {
            spdlog::warn("EXTRA in dest: {}", entry);
            report.extra.push_back(entry);
        }
    }
    return report;
}

} // namespace psync::transfer
