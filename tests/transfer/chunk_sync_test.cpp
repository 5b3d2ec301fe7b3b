#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"
#include "psync/storage/local_backend.hpp"
#include "psync/transfer/chunk_sync.hpp"
#include "psync/transfer/compare.hpp"

#include "support/remote_backend.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <utility>

namespace fs = std::filesystem;
using psync::events::ChunkMatchedEvent;
using psync::events::ChunkRewrittenEvent;
using psync::events::EventBus;
using psync::events::FileCopiedEvent;
using psync::events::FileSkippedEvent;
using psync::progress::CountingProgress;
using psync::storage::LocalBackend;
using psync::test::RemoteLikeBackend;
using psync::test::TempDir;
using psync::test::count_entries;
using psync::test::read_file;
using psync::test::write_file;
using psync::transfer::EngineContext;
using psync::transfer::SyncOptions;

namespace {

constexpr std::size_t kChunk = 16 * 1024;
constexpr std::size_t kFileSize = 256 * 1024;

/// Small limits so that a 256 KiB file is synced chunk by chunk
SyncOptions chunked_options(std::size_t threads = 4) {
    SyncOptions options;
    options.threads = threads;
    options.no_progress = true;
    options.chunk_size = kChunk;
    options.large_file_threshold = 64 * 1024;
    return options;
}

std::string patterned(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 7) & 0xff);
    }
    return data;
}

/// Moves the mtime an hour back so the size + mtime shortcut does not apply
void age(const fs::path& path) {
    fs::last_write_time(path, fs::last_write_time(path) - std::chrono::hours(1));
}

struct ChunkCounts {
    std::atomic<int> rewritten{0};
    std::atomic<int> matched{0};
    std::atomic<int> skipped{0};
    std::atomic<int> copied{0};

    explicit ChunkCounts(EventBus& bus) {
        bus.subscribe<ChunkRewrittenEvent>([this](const ChunkRewrittenEvent&) { rewritten++; });
        bus.subscribe<ChunkMatchedEvent>([this](const ChunkMatchedEvent&) { matched++; });
        bus.subscribe<FileSkippedEvent>([this](const FileSkippedEvent&) { skipped++; });
        bus.subscribe<FileCopiedEvent>([this](const FileCopiedEvent&) { copied++; });
    }
};

/// Truncates `victim` once discovery has sized the run, before any chunk is read
class ShrinkAfterDiscovery : public CountingProgress {
public:
    explicit ShrinkAfterDiscovery(fs::path victim) : victim_(std::move(victim)) {}

    void set_total(std::uint64_t total) override {
        CountingProgress::set_total(total);
        fs::resize_file(victim_, 0);
    }

private:
    fs::path victim_;
};

} // namespace

TEST(ChunkSyncTest, Adler32MatchesKnownValue) {
    const char* text = "Wikipedia";
    EXPECT_EQ(psync::transfer::adler32_checksum(text, std::strlen(text)), 0x11E60398u);
    EXPECT_EQ(psync::transfer::adler32_checksum(text, 0), 1u);
}

TEST(ChunkSyncTest, FreshDestinationGetsFullTree) {
    TempDir src;
    TempDir dst;
    write_file(src / "small.txt", "hello");
    write_file(src / "sub/big.bin", patterned(kFileSize));
    fs::create_directories(src / "sub/empty");

    LocalBackend backend;
    CountingProgress progress;
    const auto status = psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                              EngineContext{&progress, nullptr, nullptr});

    ASSERT_TRUE(status.is_ok()) << status.error().to_string();
    EXPECT_TRUE(psync::transfer::compare_dirs(src.path(), dst.path()).passed());
    EXPECT_TRUE(fs::is_directory(dst / "sub/empty"));
    EXPECT_EQ(progress.total(), 5 + kFileSize);
    EXPECT_EQ(progress.position(), progress.total());
    EXPECT_EQ(progress.finish_message(), "Sync complete");
}

TEST(ChunkSyncTest, SkipsFilesWithSameSizeAndMtime) {
    TempDir src;
    TempDir dst;
    write_file(src / "f.txt", "source");
    write_file(dst / "f.txt", "stale!");
    const auto stamp = fs::last_write_time(src / "f.txt");
    fs::last_write_time(dst / "f.txt", stamp);

    EventBus bus;
    ChunkCounts counts(bus);

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                      EngineContext{nullptr, &bus, nullptr}).is_ok());

    // Shortcut trusts metadata: contents are left alone
    EXPECT_EQ(read_file(dst / "f.txt"), "stale!");
    EXPECT_EQ(fs::last_write_time(dst / "f.txt"), stamp);
    EXPECT_EQ(counts.skipped.load(), 1);
    EXPECT_EQ(counts.copied.load(), 0);
}

TEST(ChunkSyncTest, RewritesOnlyTheChangedChunk) {
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);

    auto stale = content;
    stale[5 * kChunk + 100] = static_cast<char>(~stale[5 * kChunk + 100]);
    write_file(dst / "big.bin", stale);
    age(dst / "big.bin");

    EventBus bus;
    ChunkCounts counts(bus);

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                      EngineContext{nullptr, &bus, nullptr}).is_ok());

    EXPECT_EQ(counts.rewritten.load(), 1);
    EXPECT_EQ(counts.matched.load(), 15);
    EXPECT_EQ(read_file(dst / "big.bin"), content);
    EXPECT_EQ(fs::last_write_time(dst / "big.bin"), fs::last_write_time(src / "big.bin"));
}

TEST(ChunkSyncTest, TruncatesLongerDestination) {
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);
    write_file(dst / "big.bin", content + std::string(3 * kChunk + 7, 'z'));
    age(dst / "big.bin");

    EventBus bus;
    ChunkCounts counts(bus);

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                      EngineContext{nullptr, &bus, nullptr}).is_ok());

    EXPECT_EQ(fs::file_size(dst / "big.bin"), kFileSize);
    EXPECT_EQ(read_file(dst / "big.bin"), content);
    EXPECT_EQ(counts.matched.load(), 16);
}

TEST(ChunkSyncTest, GrowsShorterDestination) {
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);
    write_file(dst / "big.bin", content.substr(0, 100 * 1024));
    age(dst / "big.bin");

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options()).is_ok());
    EXPECT_EQ(read_file(dst / "big.bin"), content);
}

TEST(ChunkSyncTest, SecondRunSkipsEverything) {
    TempDir src;
    TempDir dst;
    write_file(src / "a.txt", "aaa");
    write_file(src / "nested/big.bin", patterned(kFileSize));

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options()).is_ok());

    EventBus bus;
    ChunkCounts counts(bus);
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                      EngineContext{nullptr, &bus, nullptr}).is_ok());

    EXPECT_EQ(counts.skipped.load(), 2);
    EXPECT_EQ(counts.copied.load(), 0);
    EXPECT_EQ(counts.rewritten.load() + counts.matched.load(), 0);
}

TEST(ChunkSyncTest, DryRunChangesNothing) {
    TempDir src;
    TempDir dst;
    write_file(src / "a.txt", "aaa");
    write_file(src / "dir/b.txt", "bbb");

    auto options = chunked_options();
    options.dry_run = true;

    LocalBackend backend;
    CountingProgress progress;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), options,
                                      EngineContext{&progress, nullptr, nullptr}).is_ok());

    EXPECT_EQ(count_entries(dst.path()), 0u);
    EXPECT_EQ(progress.position(), 6u);
}

TEST(ChunkSyncTest, SkipsSymlinks) {
    TempDir src;
    TempDir dst;
    write_file(src / "real.txt", "r");
    fs::create_symlink("real.txt", src / "link");

    LocalBackend backend;
    ASSERT_TRUE(psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options()).is_ok());

    EXPECT_TRUE(fs::exists(dst / "real.txt"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(dst / "link")));
}

TEST(ChunkSyncTest, ZeroChunkSizeIsRejected) {
    TempDir src;
    TempDir dst;
    auto options = chunked_options();
    options.chunk_size = 0;

    LocalBackend backend;
    const auto status = psync::transfer::sync(backend, src.str(), backend, dst.str(), options);
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind(), psync::ErrorKind::Other);
}

TEST(ChunkSyncTest, MissingSourceIsNotFound) {
    TempDir dst;
    LocalBackend backend;
    const auto status = psync::transfer::sync(backend, (dst / "missing").string(), backend, dst.str(),
                                              chunked_options());
    ASSERT_TRUE(status.is_error());
    EXPECT_TRUE(status.error().is_not_found());
}

TEST(ChunkSyncTest, NonLocalDestinationGetsWholeFiles) {
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);
    write_file(dst / "big.bin", patterned(kFileSize / 2));
    age(dst / "big.bin");

    EventBus bus;
    ChunkCounts counts(bus);

    LocalBackend local;
    RemoteLikeBackend remote;
    ASSERT_TRUE(psync::transfer::sync(local, src.str(), remote, dst.str(), chunked_options(),
                                      EngineContext{nullptr, &bus, nullptr}).is_ok());

    EXPECT_EQ(remote.puts.load(), 1);
    EXPECT_EQ(counts.rewritten.load() + counts.matched.load(), 0);
    EXPECT_EQ(read_file(dst / "big.bin"), content);
}

TEST(ChunkSyncTest, UnreadableDestinationIsWrittenWithoutComparing) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);

    auto stale = content;
    stale[3 * kChunk] = static_cast<char>(~stale[3 * kChunk]);
    write_file(dst / "big.bin", stale);
    age(dst / "big.bin");
    fs::permissions(dst / "big.bin", fs::perms::owner_write);

    EventBus bus;
    ChunkCounts counts(bus);

    LocalBackend backend;
    const auto status = psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                              EngineContext{nullptr, &bus, nullptr});
    fs::permissions(dst / "big.bin", fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_TRUE(status.is_ok()) << status.error().to_string();
    EXPECT_EQ(counts.rewritten.load(), 16);
    EXPECT_EQ(counts.matched.load(), 0);
    EXPECT_EQ(read_file(dst / "big.bin"), content);
    EXPECT_EQ(fs::last_write_time(dst / "big.bin"), fs::last_write_time(src / "big.bin"));
}

TEST(ChunkSyncTest, UnwritableDestinationFailsEveryChunk) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);
    write_file(dst / "big.bin", std::string(kFileSize, 'x'));
    age(dst / "big.bin");
    fs::permissions(dst / "big.bin", fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);

    CountingProgress progress;
    LocalBackend backend;
    const auto status = psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                              EngineContext{&progress, nullptr, nullptr});
    fs::permissions(dst / "big.bin", fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().message(), "16 errors occurred during sync");
    EXPECT_EQ(read_file(dst / "big.bin"), std::string(kFileSize, 'x'));
    // A failed file keeps its old mtime so the next run looks at it again
    EXPECT_NE(fs::last_write_time(dst / "big.bin"), fs::last_write_time(src / "big.bin"));
    EXPECT_EQ(progress.position(), progress.total());
}

TEST(ChunkSyncTest, SourceShrunkAfterDiscoveryStillCompletesProgress) {
    TempDir src;
    TempDir dst;
    const auto content = patterned(kFileSize);
    write_file(src / "big.bin", content);
    write_file(dst / "big.bin", content);
    age(dst / "big.bin");

    ShrinkAfterDiscovery progress(src / "big.bin");
    LocalBackend backend;
    const auto status = psync::transfer::sync(backend, src.str(), backend, dst.str(), chunked_options(),
                                              EngineContext{&progress, nullptr, nullptr});

    ASSERT_TRUE(status.is_ok()) << status.error().to_string();
    EXPECT_EQ(progress.total(), kFileSize);
    EXPECT_EQ(progress.position(), kFileSize);
}
