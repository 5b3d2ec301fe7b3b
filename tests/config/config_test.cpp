#include "psync/config/config.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using psync::config::EngineConfig;
using psync::config::compile_filters;
using psync::config::load_config;
using psync::config::parse_config;
using psync::test::TempDir;
using psync::test::write_file;

TEST(ConfigTest, DefaultsMatchEngineDefaults) {
    const EngineConfig config;
    EXPECT_GE(config.threads, 1u);
    EXPECT_EQ(config.chunk_size, psync::transfer::kDefaultChunkSize);
    EXPECT_EQ(config.large_file_threshold, psync::transfer::kLargeFileThreshold);
    EXPECT_TRUE(config.preserve_times);
    EXPECT_TRUE(config.verify);
    EXPECT_FALSE(config.dry_run);
}

TEST(ConfigTest, OverlaysOnlyPresentKeys) {
    EngineConfig base;
    base.threads = 3;
    base.exclude = "keep-me";

    auto result = parse_config(R"({"chunk_size": 4096, "dry_run": true, "include": "\\.txt$"})", base);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& config = result.value();
    EXPECT_EQ(config.threads, 3u);
    EXPECT_EQ(config.exclude, "keep-me");
    EXPECT_EQ(config.chunk_size, 4096u);
    EXPECT_TRUE(config.dry_run);
    EXPECT_EQ(config.include, "\\.txt$");
}

TEST(ConfigTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_config("{not json").is_error());
    EXPECT_TRUE(parse_config("[1, 2]").is_error());
    EXPECT_TRUE(parse_config(R"({"threads": "eight"})").is_error());
    EXPECT_TRUE(parse_config(R"({"threads": 0})").is_error());

    auto zero_chunk = parse_config(R"({"chunk_size": 0})");
    ASSERT_TRUE(zero_chunk.is_error());
    EXPECT_EQ(zero_chunk.error().kind(), psync::ErrorKind::Other);
}

TEST(ConfigTest, RejectsNegativeFractionalAndOversizedCounts) {
    for (const char* text : {R"({"threads": -1})", R"({"threads": 1.5})", R"({"threads": 5000})",
                             R"({"chunk_size": -4})", R"({"chunk_size": 4294967296})",
                             R"({"large_file_threshold": -1})"}) {
        auto result = parse_config(text);
        ASSERT_TRUE(result.is_error()) << text;
        EXPECT_EQ(result.error().kind(), psync::ErrorKind::Other) << text;
    }

    auto at_limit = parse_config(R"({"threads": 1024})");
    ASSERT_TRUE(at_limit.is_ok()) << at_limit.error().to_string();
    EXPECT_EQ(at_limit.value().threads, psync::transfer::kMaxWorkers);
}

TEST(ConfigTest, SerializedConfigParsesBack) {
    EngineConfig config;
    config.threads = 7;
    config.include = "a+";
    config.verify = false;
    config.large_file_threshold = 1234;

    auto parsed = parse_config(psync::config::to_json(config));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().threads, 7u);
    EXPECT_EQ(parsed.value().include, "a+");
    EXPECT_FALSE(parsed.value().verify);
    EXPECT_EQ(parsed.value().large_file_threshold, 1234u);
}

TEST(ConfigTest, LoadsFromFile) {
    TempDir tmp;
    write_file(tmp / "psync.json", R"({"threads": 2, "no_progress": true})");

    auto loaded = load_config(tmp / "psync.json");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().threads, 2u);
    EXPECT_TRUE(loaded.value().no_progress);

    auto missing = load_config(tmp / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_TRUE(missing.error().is_not_found());
}

TEST(ConfigTest, CompilesFiltersAndPassesThemOn) {
    EngineConfig config;
    config.include = R"(\.log$)";
    config.threads = 5;

    auto filters = compile_filters(config);
    ASSERT_TRUE(filters.is_ok());
    EXPECT_NE(filters.value().include_ptr(), nullptr);
    EXPECT_EQ(filters.value().exclude_ptr(), nullptr);

    const auto copy = psync::config::to_copy_options(config, filters.value());
    EXPECT_EQ(copy.threads, 5u);
    EXPECT_EQ(copy.include, filters.value().include_ptr());

    const auto remove = psync::config::to_delete_options(config, filters.value());
    EXPECT_EQ(remove.include, filters.value().include_ptr());

    config.exclude = "([unclosed";
    auto bad = compile_filters(config);
    ASSERT_TRUE(bad.is_error());
    EXPECT_NE(bad.error().message().find("Invalid exclude pattern"), std::string::npos);
}
