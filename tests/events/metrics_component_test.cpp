#include "psync/events/components.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using psync::TransferError;
using psync::events::ChunkMatchedEvent;
using psync::events::ChunkRewrittenEvent;
using psync::events::EventBus;
using psync::events::FileCopiedEvent;
using psync::events::FileSkippedEvent;
using psync::events::LoggerComponent;
using psync::events::MetricsComponent;
using psync::events::OperationCompletedEvent;
using psync::events::PathDeletedEvent;
using psync::events::TransferFailedEvent;

TEST(MetricsComponentTest, TracksTransferCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileCopiedEvent{"/src/a", "/dst/a", 1024, "copy_file_range"});
    bus.emit(FileCopiedEvent{"/src/b", "/dst/b", 2048, "stream"});
    bus.emit(FileSkippedEvent{"/src/c", "/dst/c", 4096, "size and mtime match"});
    bus.emit(ChunkRewrittenEvent{"/dst/big", 3, 3u << 20, 1u << 20});
    bus.emit(ChunkMatchedEvent{"/dst/big", 4, 4u << 20, 1u << 20});
    bus.emit(ChunkMatchedEvent{"/dst/big", 5, 5u << 20, 1u << 20});
    bus.emit(PathDeletedEvent{"/dst/old", true});
    bus.emit(TransferFailedEvent{"copy", "/src/d", TransferError::io("read failed")});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_copied.load(), 2u);
    EXPECT_EQ(stats.bytes_copied.load(), 3072u);
    EXPECT_EQ(stats.files_skipped.load(), 1u);
    EXPECT_EQ(stats.bytes_skipped.load(), 4096u);
    EXPECT_EQ(stats.chunks_rewritten.load(), 1u);
    EXPECT_EQ(stats.bytes_rewritten.load(), 1u << 20);
    EXPECT_EQ(stats.chunks_matched.load(), 2u);
    EXPECT_EQ(stats.paths_deleted.load(), 1u);
    EXPECT_EQ(stats.failures.load(), 1u);
}

TEST(MetricsComponentTest, LoggerAndMetricsShareOneBus) {
    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    bus.emit(FileCopiedEvent{"/src/a", "/dst/a", 10, "reflink"});
    bus.emit(OperationCompletedEvent{"copy", 0, std::chrono::milliseconds{5}});

    EXPECT_EQ(metrics.get_stats().files_copied.load(), 1u);
    EXPECT_EQ(bus.subscriber_count<FileCopiedEvent>(), 2u);
    EXPECT_NO_THROW(metrics.print_stats());
}
