#include "psync/transfer/synchronizer.hpp"

#include "engine_support.hpp"
#include "psync/storage/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

bool is_empty_directory(const fs::path& path) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    return !ec && it == fs::directory_iterator();
}

fs::path destination_for(const fs::path& item, const fs::path& source_root, const fs::path& dest_root) {
    const auto relative = detail::relative_to(item.string(), source_root.string());
    return relative.empty() ? dest_root : dest_root / relative;
}

void transfer_item(const storage::Source& source, const storage::Sink& sink, const SyncItem& item,
                   const fs::path& dest, bool dry_run, detail::RunContext& run) {
    switch (item.kind) {
        case storage::EntryKind::Directory:
            if (dry_run) {
                spdlog::debug("Dry-run: would create empty directory {}", dest.string());
                return;
            }
            if (auto res = sink.create_dir(dest); res.is_error()) {
                run.fail(dest.string(), res.error());
                return;
            }
            spdlog::debug("Created directory {}", dest.string());
            return;

        case storage::EntryKind::Symlink: {
            auto target = source.read_link(item.path);
            if (target.is_error()) {
                run.fail(item.path.string(), target.error());
                return;
            }
            if (dry_run) {
                spdlog::debug("Dry-run: would create symlink {} -> {}", dest.string(), target.value().string());
                return;
            }
            if (auto res = sink.create_symlink(target.value(), dest); res.is_error()) {
                run.fail(dest.string(), res.error());
                return;
            }
            run.publish(events::FileCopiedEvent{item.path.string(), dest.string(), 0, "symlink"});
            return;
        }

        default:
            if (dry_run) {
                spdlog::debug("Dry-run: would copy {} to {}", item.path.string(), dest.string());
                return;
            }
            if (auto res = sink.copy_from(item.path, dest); res.is_error()) {
                run.fail(item.path.string(), res.error());
                return;
            }
            run.publish(events::FileCopiedEvent{item.path.string(), dest.string(), item.size, "sink"});
            return;
    }
}

} // namespace

std::vector<SyncItem> Synchronizer::files_to_sync(const fs::path& source_root,
                                                  const fs::path& dest_root,
                                                  const std::regex* include,
                                                  const std::regex* exclude,
                                                  bool verify) const {
    std::vector<SyncItem> items;

    auto consider = [&](const fs::path& path) {
        auto metadata = storage::LocalBackend::metadata_of(path);
        if (metadata.is_error()) {
            spdlog::debug("Skipping {}: {}", path.string(), metadata.error().to_string());
            return;
        }
        const auto& meta = metadata.value();

        const bool wanted = meta.is_file() || meta.is_symlink() || (meta.is_directory() && is_empty_directory(path));
        if (!wanted || !passes_filters(path.string(), include, exclude)) {
            return;
        }

        if (verify && meta.is_file()) {
            const auto dest = destination_for(path, source_root, dest_root);
            if (sink_.exists(dest)) {
                const auto dest_hash = sink_.hash(dest);
                if (dest_hash && dest_hash == source_.hash(path)) {
                    spdlog::debug("Up to date: {}", path.string());
                    return;
                }
            }
        }

        items.push_back(SyncItem{path, meta.is_directory() ? 0 : meta.size, meta.kind});
    };

    consider(source_root);

    std::error_code ec;
    fs::recursive_directory_iterator it(source_root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        consider(it->path());
    }
    if (ec) {
        spdlog::debug("Walk of {} stopped early: {}", source_root.string(), ec.message());
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const SyncItem& a, const SyncItem& b) { return a.size > b.size; });
    return items;
}

Status Synchronizer::sync_files(const std::vector<SyncItem>& items,
                                const fs::path& source_root,
                                const fs::path& dest_root,
                                const SynchronizerOptions& options,
                                const EngineContext& context) const {
    detail::RunContext run(context, "synchronize", options.no_progress, progress::ProgressUnit::Bytes);

    std::uint64_t total = 0;
    for (const auto& item : items) {
        total += item.size;
    }
    run.progress().set_total(total);

    std::atomic<std::size_t> cursor{0};
    const auto thread_count = std::min(detail::worker_count(options.threads), std::max<std::size_t>(items.size(), 1));

    detail::WorkerGroup workers;
    auto started = workers.start(thread_count, [&] {
        for (std::size_t index = cursor++; index < items.size(); index = cursor++) {
            const auto& item = items[index];
            transfer_item(source_, sink_, item, destination_for(item.path, source_root, dest_root),
                          options.dry_run, run);
            run.progress().increment(item.size);
        }
    });
    if (started.is_error()) {
        // Let the workers that did start finish what they hold and stop
        cursor = items.size();
        return started;
    }
    workers.join();

    return run.complete("Synchronize complete");
}

} // namespace psync::transfer
