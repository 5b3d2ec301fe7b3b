#include "psync/transfer/delete_engine.hpp"

#include "engine_support.hpp"
#include "psync/core/work_queue.hpp"
#include "psync/storage/walk.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

struct DeleteJob {
    std::string path;
    bool is_directory = false;
};

std::string without_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::size_t component_count(const std::string& path) {
    const fs::path p(path);
    return static_cast<std::size_t>(std::distance(p.begin(), p.end()));
}

/**
 * @brief Mark every directory between `path` and `root` as non-removable
 */
void retain_ancestors(const std::string& path, const std::string& root,
                      std::unordered_set<std::string>& retained) {
    const std::string root_key = without_trailing_slash(root);
    fs::path current = fs::path(path).parent_path();
    while (!current.empty()) {
        const std::string key = without_trailing_slash(current.string());
        if (key.size() < root_key.size() || !retained.insert(key).second) {
            break;
        }
        const auto parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
}

/**
 * @brief Walk one root, hand every non-directory to `on_item`
 *
 * RETURNS: Removable directories of the root, deepest first
 */
template<typename OnItem>
std::vector<DeleteJob> scan_root(const storage::StorageBackend& backend, const std::string& root,
                                 const DeleteOptions& options, OnItem&& on_item) {
    const bool filtering = options.include != nullptr || options.exclude != nullptr;
    std::vector<std::pair<std::size_t, std::string>> directories;
    std::unordered_set<std::string> retained;

    storage::walk(backend, root, [&](const storage::FileEntry& entry, std::size_t) {
        if (!passes_filters(entry.path, options.include, options.exclude)) {
            if (filtering) {
                retain_ancestors(entry.path, root, retained);
            }
            return;
        }
        if (entry.metadata.is_directory()) {
            directories.emplace_back(component_count(entry.path), entry.path);
        } else {
            on_item(DeleteJob{entry.path, false});
        }
    });

    std::stable_sort(directories.begin(), directories.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<DeleteJob> jobs;
    jobs.reserve(directories.size());
    for (auto& directory : directories) {
        if (retained.count(without_trailing_slash(directory.second)) > 0) {
            spdlog::debug("Keeping {}: holds filtered-out entries", directory.second);
            continue;
        }
        jobs.push_back(DeleteJob{std::move(directory.second), true});
    }
    return jobs;
}

} // namespace

Status remove_tree(const storage::StorageBackend& backend, const std::vector<std::string>& paths,
                   const DeleteOptions& options, const EngineContext& context) {
    detail::RunContext run(context, "delete", options.no_progress, progress::ProgressUnit::Items);

    std::uint64_t total = 0;
    for (const auto& root : paths) {
        const auto directories = scan_root(backend, root, options, [&total](const DeleteJob&) { ++total; });
        total += directories.size();
    }
    run.progress().set_total(total);

    WorkQueue<DeleteJob> queue;

    const auto thread_count = detail::worker_count(options.threads);
    spdlog::debug("delete: {} roots, {} entries, {} workers", paths.size(), total, thread_count);

    detail::WorkerGroup workers;
    auto started = workers.start(thread_count, [&] {
        while (auto job = queue.pop()) {
            if (options.dry_run) {
                spdlog::info("Would delete: {}", job->path);
            } else if (auto res = backend.remove(job->path); res.is_error()) {
                if (res.error().is_not_found()) {
                    spdlog::debug("{} already removed", job->path);
                } else {
                    run.fail(job->path, res.error());
                }
            } else {
                run.publish(events::PathDeletedEvent{job->path, job->is_directory});
            }
            run.progress().increment(1);
        }
    });
    if (started.is_error()) {
        queue.close();
        return started;
    }

    // The calling thread is the producer
    for (const auto& root : paths) {
        auto directories = scan_root(backend, root, options, [&queue](DeleteJob job) {
            queue.push(std::move(job));
        });
        for (auto& job : directories) {
            queue.push(std::move(job));
        }
    }
    queue.close();
    workers.join();

    return run.complete("Delete complete");
}

} // namespace psync::transfer
