#include "psync/core/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

using psync::Err;
using psync::Ok;
using psync::Status;
using psync::TransferError;
using psync::TransferResult;

namespace {

TransferResult<std::uint64_t> parse_size(const std::string& text) {
    if (text.empty()) {
        return Err<std::uint64_t>(TransferError::other("empty size"));
    }
    return Ok<TransferError>(static_cast<std::uint64_t>(std::stoull(text)));
}

} // namespace

TEST(ResultTest, HoldsValueOrError) {
    const auto good = parse_size("42");
    ASSERT_TRUE(good.is_ok());
    EXPECT_FALSE(good.is_error());
    EXPECT_EQ(good.value(), 42u);

    const auto bad = parse_size("");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().message(), "empty size");
    EXPECT_THROW(static_cast<void>(bad.value()), std::bad_variant_access);
}

TEST(ResultTest, SameValueAndErrorTypeStayDistinct) {
    const auto ok = Ok<std::string>(std::string("done"));
    const auto err = Err<std::string>(std::string("done"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "done");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "done");
}

TEST(ResultTest, MoveOnlyValueCanBeTakenOut) {
    auto result = Ok<TransferError>(std::make_unique<int>(7));
    ASSERT_TRUE(result.is_ok());

    std::unique_ptr<int> owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, StatusCarriesOnlyAnError) {
    const Status fine = Ok<TransferError>();
    EXPECT_TRUE(fine.is_ok());
    EXPECT_THROW(static_cast<void>(fine.error()), std::bad_optional_access);

    Status failed = Err<void>(TransferError::not_found("/gone"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_TRUE(failed.error().is_not_found());
}
