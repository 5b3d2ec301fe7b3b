#include "psync/core/error.hpp"
#include "psync/core/error_collector.hpp"
#include "psync/core/format.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using psync::ErrorCollector;
using psync::ErrorKind;
using psync::TransferError;

TEST(TransferErrorTest, FactoriesSetKindAndMessage) {
    const auto io = TransferError::io("disk on fire", std::make_error_code(std::errc::io_error));
    EXPECT_EQ(io.kind(), ErrorKind::Io);
    EXPECT_EQ(io.message(), "disk on fire");
    EXPECT_EQ(io.code(), std::make_error_code(std::errc::io_error));

    const auto missing = TransferError::not_found("/tmp/nope");
    EXPECT_TRUE(missing.is_not_found());
    EXPECT_EQ(missing.message(), "/tmp/nope");
    EXPECT_FALSE(missing.code());

    const auto other = TransferError::other("Unsupported protocol: ftp");
    EXPECT_EQ(other.kind(), ErrorKind::Other);
    EXPECT_EQ(other.to_string(), "Other: Unsupported protocol: ftp");
}

TEST(TransferErrorTest, FromErrorCodeMapsEnoentToNotFound) {
    const auto missing = TransferError::from_error_code(std::make_error_code(std::errc::no_such_file_or_directory), "a/b");
    EXPECT_EQ(missing.kind(), ErrorKind::NotFound);
    EXPECT_EQ(missing.message(), "a/b");

    const auto denied = TransferError::from_error_code(std::make_error_code(std::errc::permission_denied), "a/b");
    EXPECT_EQ(denied.kind(), ErrorKind::Io);
    EXPECT_NE(denied.message().find("a/b"), std::string::npos);
    EXPECT_EQ(denied.code(), std::make_error_code(std::errc::permission_denied));
}

TEST(TransferErrorTest, StatusCarriesError) {
    psync::Status ok = psync::Ok<TransferError>();
    EXPECT_TRUE(ok.is_ok());

    psync::Status failed = psync::Err<void>(TransferError::not_found("x"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_TRUE(failed.error().is_not_found());

    auto bytes = psync::Ok<TransferError>(std::uint64_t{42});
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value(), 42u);
}

TEST(ErrorCollectorTest, EmptyCollectorIsOk) {
    ErrorCollector errors;
    EXPECT_TRUE(errors.empty());
    EXPECT_TRUE(errors.into_status("copy").is_ok());
}

TEST(ErrorCollectorTest, AggregatesCountIntoOtherError) {
    ErrorCollector errors;

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&errors]() {
            for (int j = 0; j < 25; ++j) {
                errors.push(TransferError::io("boom"));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(errors.size(), 100u);
    const auto status = errors.into_status("delete");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind(), ErrorKind::Other);
    EXPECT_EQ(status.error().message(), "100 errors occurred during delete");

    const auto taken = errors.take();
    EXPECT_EQ(taken.size(), 100u);
    EXPECT_TRUE(errors.empty());
}

TEST(FormatTest, HumanReadableSize) {
    EXPECT_EQ(psync::human_readable_size(std::uint64_t{0}), "0.00 B");
    EXPECT_EQ(psync::human_readable_size(std::uint64_t{1023}), "1023.00 B");
    EXPECT_EQ(psync::human_readable_size(std::uint64_t{1536}), "1.50 KiB");
    EXPECT_EQ(psync::human_readable_size(std::uint64_t{2} << 20), "2.00 MiB");
    EXPECT_EQ(psync::human_readable_size(std::uint64_t{1} << 60), "1.00 EiB");
}
