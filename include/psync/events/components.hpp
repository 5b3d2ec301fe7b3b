/**
 * @file components.hpp
 * @brief Ready-made subscribers for engine events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * psync::transfer::copy(..., EngineContext{&progress, &bus});
 * metrics.print_stats();
 */

#pragma once

#include "psync/core/format.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace psync::events {

/**
 * @brief Logs every engine event through spdlog
 *
 * Per-file events go to debug so a normal run stays quiet, operation
 * summaries to info. Engines log their own per-item failures.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileCopiedEvent>([this](const FileCopiedEvent& e) {
            on_file_copied(e);
        });

        bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent& e) {
            on_file_skipped(e);
        });

        bus_.subscribe<ChunkRewrittenEvent>([this](const ChunkRewrittenEvent& e) {
            on_chunk_rewritten(e);
        });

        bus_.subscribe<PathDeletedEvent>([this](const PathDeletedEvent& e) {
            on_path_deleted(e);
        });

        bus_.subscribe<OperationCompletedEvent>([this](const OperationCompletedEvent& e) {
            on_operation_completed(e);
        });
    }

private:
    void on_file_copied(const FileCopiedEvent& e) {
        spdlog::debug("[Copied] {} -> {} bytes={} via={}", e.source_path, e.dest_path, e.bytes, e.method);
    }

    void on_file_skipped(const FileSkippedEvent& e) {
        spdlog::debug("[Skipped] {} ({})", e.dest_path, e.reason);
    }

    void on_chunk_rewritten(const ChunkRewrittenEvent& e) {
        spdlog::debug("[ChunkRewritten] path={} chunk={} offset={} bytes={}",
                      e.dest_path, e.chunk_index, e.offset, e.bytes);
    }

    void on_path_deleted(const PathDeletedEvent& e) {
        spdlog::debug("[Deleted] {}{}", e.path, e.is_directory ? "/" : "");
    }

    void on_operation_completed(const OperationCompletedEvent& e) {
        if (e.failures == 0) {
            spdlog::info("{} complete in {}ms", e.operation, e.duration.count());
        } else {
            spdlog::warn("{} finished in {}ms with {} failed items", e.operation, e.duration.count(), e.failures);
        }
    }

    EventBus& bus_;
};

/**
 * @brief Tracks counters across one or more engine runs
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_copied{0};
        std::atomic<uint64_t> bytes_copied{0};
        std::atomic<uint64_t> files_skipped{0};
        std::atomic<uint64_t> bytes_skipped{0};
        std::atomic<uint64_t> chunks_rewritten{0};
        std::atomic<uint64_t> bytes_rewritten{0};
        std::atomic<uint64_t> chunks_matched{0};
        std::atomic<uint64_t> paths_deleted{0};
        std::atomic<uint64_t> failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileCopiedEvent>([this](const FileCopiedEvent& e) {
            stats_.files_copied++;
            stats_.bytes_copied += e.bytes;
        });

        bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent& e) {
            stats_.files_skipped++;
            stats_.bytes_skipped += e.bytes;
        });

        bus_.subscribe<ChunkRewrittenEvent>([this](const ChunkRewrittenEvent& e) {
            stats_.chunks_rewritten++;
            stats_.bytes_rewritten += e.bytes;
        });

        bus_.subscribe<ChunkMatchedEvent>([this](const ChunkMatchedEvent&) {
            stats_.chunks_matched++;
        });

        bus_.subscribe<PathDeletedEvent>([this](const PathDeletedEvent&) {
            stats_.paths_deleted++;
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Files copied:     {}", stats_.files_copied.load());
        spdlog::info("  Bytes copied:     {}", human_readable_size(stats_.bytes_copied.load()));
        spdlog::info("  Files skipped:    {}", stats_.files_skipped.load());
        spdlog::info("  Chunks rewritten: {}", stats_.chunks_rewritten.load());
        spdlog::info("  Bytes rewritten:  {}", human_readable_size(stats_.bytes_rewritten.load()));
        spdlog::info("  Chunks matched:   {}", stats_.chunks_matched.load());
        spdlog::info("  Paths deleted:    {}", stats_.paths_deleted.load());
        spdlog::info("  Failures:         {}", stats_.failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace psync::events
