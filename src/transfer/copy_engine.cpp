#include "psync/transfer/copy_engine.hpp"

#include "engine_support.hpp"
#include "psync/core/work_queue.hpp"
#include "psync/storage/walk.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <unordered_set>
#include <vector>

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

struct CopyJob {
    std::string relative_path;   // empty when the root itself is the file
    std::uint64_t size = 0;
    std::optional<fs::file_time_type> modified;
    bool is_symlink = false;
};

Status replicate_symlink(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    const auto target = fs::read_symlink(source, ec);
    if (ec) {
        return Err<void>(TransferError::from_error_code(ec, source.string()));
    }

    if (fs::exists(fs::symlink_status(destination, ec))) {
        fs::remove(destination, ec);
        if (ec) {
            return Err<void>(TransferError::from_error_code(ec, destination.string()));
        }
    }

    fs::create_symlink(target, destination, ec);
    if (ec) {
        return Err<void>(TransferError::from_error_code(ec, destination.string()));
    }
    return Ok<TransferError>();
}

/**
 * @brief Per-thread state: path buffers, created-directory memo, copy buffer
 */
class CopyWorker {
public:
    CopyWorker(const storage::StorageBackend& source, const std::string& source_root,
               const storage::StorageBackend& dest, const std::string& dest_root,
               const CopyOptions& options, bool local, detail::RunContext& run)
        : source_(source), dest_(dest),
          source_root_(source_root), dest_root_(dest_root),
          options_(options), local_(local), run_(run) {}

    void run(WorkQueue<CopyJob>& queue) {
        while (auto job = queue.pop()) {
            process(*job);
            run_.progress().increment(job->size);
        }
    }

private:
    void process(const CopyJob& job) {
        source_file_ = source_root_;
        dest_file_ = dest_root_;
        if (!job.relative_path.empty()) {
            source_file_ /= job.relative_path;
            dest_file_ /= job.relative_path;
        }

        if (options_.dry_run) {
            spdlog::debug("Dry-run: would copy {} -> {}", source_file_.string(), dest_file_.string());
            return;
        }

        if (!local_) {
            copy_through_backends();
            return;
        }

        if (!ensure_parent(dest_file_)) {
            return;
        }

        if (job.is_symlink) {
            if (auto res = replicate_symlink(source_file_, dest_file_); res.is_error()) {
                run_.fail(source_file_.string(), res.error());
                return;
            }
            run_.publish(events::FileCopiedEvent{source_file_.string(), dest_file_.string(), 0, "symlink"});
            return;
        }

        auto outcome = run_.copier().copy(source_file_, dest_file_, job.size, job.modified,
                                          options_.preserve_times, buffer_);
        if (outcome.is_error()) {
            run_.fail(source_file_.string(), outcome.error());
            return;
        }
        run_.publish(events::FileCopiedEvent{source_file_.string(), dest_file_.string(),
                                             outcome.value().bytes, outcome.value().method});
    }

    void copy_through_backends() {
        const std::string source_path = source_file_.string();
        const std::string dest_path = dest_file_.string();

        auto data = source_.get(source_path);
        if (data.is_error()) {
            run_.fail(source_path, data.error());
            return;
        }
        if (auto res = dest_.put(dest_path, data.value()); res.is_error()) {
            run_.fail(dest_path, res.error());
            return;
        }
        run_.publish(events::FileCopiedEvent{source_path, dest_path, data.value().size(), "get/put"});
    }

    bool ensure_parent(const fs::path& destination) {
        const auto parent = destination.parent_path();
        if (parent.empty() || created_dirs_.count(parent.native()) > 0) {
            return true;
        }

        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::is_directory(parent)) {
            run_.fail(parent.string(), TransferError::from_error_code(ec, parent.string()));
            return false;
        }
        created_dirs_.insert(parent.native());
        return true;
    }

    const storage::StorageBackend& source_;
    const storage::StorageBackend& dest_;
    const fs::path source_root_;
    const fs::path dest_root_;
    const CopyOptions& options_;
    const bool local_;
    detail::RunContext& run_;

    fs::path source_file_;
    fs::path dest_file_;
    std::unordered_set<std::string> created_dirs_;
    std::vector<char> buffer_;
};

} // namespace

Status copy(const storage::StorageBackend& source, const std::string& source_path,
            const storage::StorageBackend& dest, const std::string& dest_path,
            const CopyOptions& options, const EngineContext& context) {
    auto present = source.exists(source_path);
    if (present.is_error()) {
        return Err<void>(present.error());
    }
    if (!present.value()) {
        return Err<void>(TransferError::not_found(source_path));
    }

    const bool local = storage::both_local(source, dest);
    detail::RunContext run(context, "copy", options.no_progress, progress::ProgressUnit::Bytes);
    WorkQueue<CopyJob> queue;

    const auto thread_count = detail::worker_count(options.threads);
    spdlog::debug("copy: {} -> {} with {} workers ({})", source_path, dest_path, thread_count,
                  local ? "local fast path" : "get/put");

    detail::WorkerGroup workers;
    auto started = workers.start(thread_count, [&] {
        CopyWorker worker(source, source_path, dest, dest_path, options, local, run);
        worker.run(queue);
    });
    if (started.is_error()) {
        queue.close();
        return started;
    }

    // The calling thread is the producer
    storage::walk(source, source_path, [&](const storage::FileEntry& entry, std::size_t) {
        const auto& metadata = entry.metadata;
        if (!metadata.is_file() && !metadata.is_symlink()) {
            return;
        }
        if (metadata.is_symlink() && !local) {
            // get() would read through the link
            spdlog::debug("Skipping symlink {}: links are only recreated between local backends", entry.path);
            return;
        }
        if (!passes_filters(entry.path, options.include, options.exclude)) {
            return;
        }
        run.progress().increment_total(metadata.size);
        queue.push(CopyJob{detail::relative_to(entry.path, source_path), metadata.size,
                           metadata.modified, metadata.is_symlink()});
    });
    queue.close();
    workers.join();

    return run.complete("Copy complete");
}

} // namespace psync::transfer
