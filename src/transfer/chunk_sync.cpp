#include "psync/transfer/chunk_sync.hpp"

#include "engine_support.hpp"
#include "psync/core/file_descriptor.hpp"
#include "psync/core/work_queue.hpp"
#include "psync/storage/local_backend.hpp"
#include "psync/storage/walk.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace psync::transfer {
namespace fs = std::filesystem;

namespace {

struct FileJob {
    std::string source_path;
    std::string dest_path;
    std::uint64_t size = 0;
    std::optional<fs::file_time_type> modified;
};

/**
 * @brief Shared by all chunk jobs of one file
 *
 * The worker that completes the last chunk stamps the source mtime onto
 * the destination, unless any chunk failed.
 */
struct ChunkedFile {
    fs::path source;
    fs::path dest;
    std::optional<fs::file_time_type> modified;
    std::atomic<std::size_t> remaining{0};
    std::atomic<bool> failed{false};
};

struct ChunkJob {
    std::shared_ptr<ChunkedFile> file;
    std::size_t chunk_index = 0;
    std::uint64_t offset = 0;
    std::size_t length = 0;
};

bool metadata_matches(const FileJob& file, const storage::EntryMetadata& dest) {
    return dest.is_file() && dest.size == file.size && file.modified.has_value() &&
           dest.modified.has_value() && *dest.modified == *file.modified;
}

class ChunkWorker {
public:
    ChunkWorker(const SyncOptions& options, detail::RunContext& run) : options_(options), run_(run) {}

    void run(WorkQueue<ChunkJob>& queue) {
        while (auto job = queue.pop()) {
            const bool ok = process(*job);
            finish_chunk(*job->file, ok);
        }
    }

private:
    bool process(const ChunkJob& job) {
        const auto& file = *job.file;
        if (source_buffer_.size() < job.length) {
            source_buffer_.resize(job.length);
        }

        auto source = FileDescriptor::open(file.source, O_RDONLY);
        if (source.is_error()) {
            run_.fail(file.source.string(), source.error());
            run_.progress().increment(job.length);
            return false;
        }
        auto read = source.value().read_at(source_buffer_.data(), job.length, job.offset);
        if (read.is_error()) {
            run_.fail(file.source.string(), read.error());
            run_.progress().increment(job.length);
            return false;
        }
        const std::size_t n = read.value();
        if (n == 0) {
            // Source shrank since discovery
            run_.progress().increment(job.length);
            return true;
        }
        const auto source_sum = adler32_checksum(source_buffer_.data(), n);

        bool ok = true;
        auto dest = FileDescriptor::open(file.dest, O_RDWR);
        if (dest.is_error()) {
            spdlog::debug("Cannot open {} for compare ({}), writing chunk {} unconditionally",
                          file.dest.string(), dest.error().to_string(), job.chunk_index);
            ok = write_unconditionally(job, n);
        } else {
            if (dest_buffer_.size() < n) {
                dest_buffer_.resize(n);
            }
            auto dest_read = dest.value().read_at(dest_buffer_.data(), n, job.offset);
            const std::size_t m = dest_read.is_ok() ? dest_read.value() : 0;

            if (m != n || adler32_checksum(dest_buffer_.data(), m) != source_sum) {
                if (auto res = dest.value().write_at(source_buffer_.data(), n, job.offset); res.is_error()) {
                    run_.fail(file.dest.string(), res.error());
                    ok = false;
                } else {
                    run_.publish(events::ChunkRewrittenEvent{file.dest.string(), job.chunk_index, job.offset, n});
                }
            } else {
                run_.publish(events::ChunkMatchedEvent{file.dest.string(), job.chunk_index, job.offset, n});
            }
        }

        run_.progress().increment(n);
        return ok;
    }

    bool write_unconditionally(const ChunkJob& job, std::size_t n) {
        const auto& file = *job.file;
        auto dest = FileDescriptor::open(file.dest, O_WRONLY);
        if (dest.is_error()) {
            run_.fail(file.dest.string(), dest.error());
            return false;
        }
        if (auto res = dest.value().write_at(source_buffer_.data(), n, job.offset); res.is_error()) {
            run_.fail(file.dest.string(), res.error());
            return false;
        }
        run_.publish(events::ChunkRewrittenEvent{file.dest.string(), job.chunk_index, job.offset, n});
        return true;
    }

    void finish_chunk(ChunkedFile& file, bool ok) {
        if (!ok) {
            file.failed = true;
        }
        if (file.remaining.fetch_sub(1) != 1) {
            return;
        }
        if (file.failed || !options_.preserve_times || !file.modified) {
            return;
        }
        std::error_code ec;
        fs::last_write_time(file.dest, *file.modified, ec);
        if (ec) {
            spdlog::debug("Could not set mtime on {}: {}", file.dest.string(), ec.message());
        }
    }

    const SyncOptions& options_;
    detail::RunContext& run_;
    std::vector<char> source_buffer_;
    std::vector<char> dest_buffer_;
};

/**
 * @brief Phase 2 for one file
 */
class SyncProducer {
public:
    SyncProducer(const storage::StorageBackend& source, const storage::StorageBackend& dest,
                 const SyncOptions& options, bool local, detail::RunContext& run,
                 WorkQueue<ChunkJob>& queue)
        : source_(source), dest_(dest), options_(options), local_(local), run_(run), queue_(queue) {}

    void schedule(const FileJob& file) {
        auto dest_meta = dest_.stat(file.dest_path);
        const bool dest_present = dest_meta.is_ok() && dest_meta.value().is_file();

        if (dest_present && metadata_matches(file, dest_meta.value())) {
            run_.publish(events::FileSkippedEvent{file.source_path, file.dest_path, file.size, "size and mtime match"});
            run_.progress().increment(file.size);
            return;
        }

        const bool whole = !dest_present || file.size < options_.large_file_threshold || !local_;
        if (options_.dry_run) {
            spdlog::debug("Dry-run: would sync {} -> {} ({})", file.source_path, file.dest_path,
                          whole ? "whole file" : "chunked");
            run_.progress().increment(file.size);
            return;
        }

        if (whole) {
            copy_whole(file);
            run_.progress().increment(file.size);
            return;
        }

        if (dest_meta.value().size > file.size) {
            std::error_code ec;
            fs::resize_file(file.dest_path, file.size, ec);
            if (ec) {
                run_.fail(file.dest_path, TransferError::from_error_code(ec, file.dest_path));
                run_.progress().increment(file.size);
                return;
            }
        }

        enqueue_chunks(file);
    }

private:
    void copy_whole(const FileJob& file) {
        if (!local_) {
            auto data = source_.get(file.source_path);
            if (data.is_error()) {
                run_.fail(file.source_path, data.error());
                return;
            }
            if (auto res = dest_.put(file.dest_path, data.value()); res.is_error()) {
                run_.fail(file.dest_path, res.error());
                return;
            }
            run_.publish(events::FileCopiedEvent{file.source_path, file.dest_path, data.value().size(), "get/put"});
            return;
        }

        auto outcome = run_.copier().copy(file.source_path, file.dest_path, file.size, file.modified,
                                          options_.preserve_times, buffer_);
        if (outcome.is_error()) {
            run_.fail(file.source_path, outcome.error());
            return;
        }
        run_.publish(events::FileCopiedEvent{file.source_path, file.dest_path,
                                             outcome.value().bytes, outcome.value().method});
    }

    void enqueue_chunks(const FileJob& file) {
        const std::uint64_t chunk_size = options_.chunk_size;
        const auto chunk_count = static_cast<std::size_t>((file.size + chunk_size - 1) / chunk_size);

        auto chunked = std::make_shared<ChunkedFile>();
        chunked->source = file.source_path;
        chunked->dest = file.dest_path;
        chunked->modified = file.modified;
        chunked->remaining = chunk_count;

        for (std::size_t index = 0; index < chunk_count; ++index) {
            const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size;
            const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file.size - offset));
            queue_.push(ChunkJob{chunked, index, offset, length});
        }
    }

    const storage::StorageBackend& source_;
    const storage::StorageBackend& dest_;
    const SyncOptions& options_;
    const bool local_;
    detail::RunContext& run_;
    WorkQueue<ChunkJob>& queue_;
    std::vector<char> buffer_;
};

} // namespace

std::uint32_t adler32_checksum(const char* data, std::size_t length) {
    uLong sum = adler32_z(0L, Z_NULL, 0);
    sum = adler32_z(sum, reinterpret_cast<const Bytef*>(data), length);
    return static_cast<std::uint32_t>(sum);
}

Status sync(const storage::StorageBackend& source, const std::string& source_root,
            const storage::StorageBackend& dest, const std::string& dest_root,
            const SyncOptions& options, const EngineContext& context) {
    if (options.chunk_size == 0 || options.chunk_size > kMaxChunkSize) {
        return Err<void>(TransferError::other("chunk_size must be between 1 and " + std::to_string(kMaxChunkSize)));
    }

    auto present = source.exists(source_root);
    if (present.is_error()) {
        return Err<void>(present.error());
    }
    if (!present.value()) {
        return Err<void>(TransferError::not_found(source_root));
    }

    const bool local = storage::both_local(source, dest);
    detail::RunContext run(context, "sync", options.no_progress, progress::ProgressUnit::Bytes);

    // Phase 1: discovery
    std::vector<FileJob> files;
    std::uint64_t total_bytes = 0;
    storage::walk(source, source_root, [&](const storage::FileEntry& entry, std::size_t) {
        const auto dest_path = detail::join_path(dest_root, detail::relative_to(entry.path, source_root));

        if (entry.metadata.is_directory()) {
            if (!local || options.dry_run) {
                return;
            }
            std::error_code ec;
            if (!fs::is_directory(dest_path, ec)) {
                fs::create_directories(dest_path, ec);
                if (ec && !fs::is_directory(dest_path)) {
                    run.fail(dest_path, TransferError::from_error_code(ec, dest_path));
                }
            }
            return;
        }
        if (!entry.metadata.is_file()) {
            return;
        }

        if (local && !options.dry_run && dest_path == dest_root) {
            // Single file root: its directory was never walked
            if (auto res = storage::ensure_parent_exists(dest_path); res.is_error()) {
                run.fail(dest_path, res.error());
            }
        }
        total_bytes += entry.metadata.size;
        files.push_back(FileJob{entry.path, dest_path, entry.metadata.size, entry.metadata.modified});
    });
    run.progress().set_total(total_bytes);

    const auto thread_count = detail::worker_count(options.threads);
    spdlog::debug("sync: {} files, {} bytes, {} workers", files.size(), total_bytes, thread_count);

    WorkQueue<ChunkJob> queue;

    // Phase 3 workers start first so chunks are compared while Phase 2 runs
    detail::WorkerGroup workers;
    auto started = workers.start(thread_count, [&] {
        ChunkWorker worker(options, run);
        worker.run(queue);
    });
    if (started.is_error()) {
        queue.close();
        return started;
    }

    // Phase 2: the calling thread schedules every file
    SyncProducer scheduler(source, dest, options, local, run, queue);
    for (const auto& file : files) {
        scheduler.schedule(file);
    }
    queue.close();
    workers.join();

    return run.complete("Sync complete");
}

} // namespace psync::transfer
