#include "psync/transfer/compare.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using psync::test::TempDir;
using psync::test::write_file;
using psync::transfer::compare_dirs;

TEST(CompareTest, IdenticalTreesPass) {
    TempDir src;
    TempDir dst;
    for (const auto* root : {&src, &dst}) {
        write_file(*root / "a.txt", "same");
        write_file(*root / "d/b.txt", "also same");
        fs::create_symlink("a.txt", *root / "l");
    }

    const auto report = compare_dirs(src.path(), dst.path());
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.difference_count(), 0u);
}

TEST(CompareTest, ReportsMissingAndExtra) {
    TempDir src;
    TempDir dst;
    write_file(src / "only_src.txt", "x");
    write_file(dst / "only_dst.txt", "y");

    const auto report = compare_dirs(src.path(), dst.path());
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.missing, std::vector<std::string>{"only_src.txt"});
    EXPECT_EQ(report.extra, std::vector<std::string>{"only_dst.txt"});
}

TEST(CompareTest, ReportsSizeAndContentDifferences) {
    TempDir src;
    TempDir dst;
    write_file(src / "size.txt", "longer");
    write_file(dst / "size.txt", "short");
    write_file(src / "content.txt", "abc");
    write_file(dst / "content.txt", "abd");

    const auto report = compare_dirs(src.path(), dst.path());
    EXPECT_EQ(report.size_mismatch, std::vector<std::string>{"size.txt"});
    // A size difference implies a content difference as well
    EXPECT_EQ(report.checksum_mismatch.size(), 2u);
    EXPECT_TRUE(report.missing.empty());
}

TEST(CompareTest, ReportsKindDifference) {
    TempDir src;
    TempDir dst;
    write_file(src / "target.txt", "t");
    write_file(dst / "target.txt", "t");
    write_file(src / "entry", "target.txt");
    fs::create_symlink("target.txt", dst / "entry");

    const auto report = compare_dirs(src.path(), dst.path());
    EXPECT_EQ(report.type_mismatch, std::vector<std::string>{"entry"});
    EXPECT_EQ(report.difference_count(), 1u);
}
