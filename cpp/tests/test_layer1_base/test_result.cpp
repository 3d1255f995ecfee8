// tests/test_layer1_base/test_result.cpp
/**
 * @file test_result.cpp
 * @brief Unit tests for `lgtv::utils::Result` and `Status`.
 */
#include <memory>
#include <string>

#include "lgtv_base.hpp"
#include "gtest/gtest.h"

using lgtv::utils::Result;
using lgtv::utils::Status;

namespace
{

enum class SampleErrc
{
    First,
    Second
};

Result<int, SampleErrc> parse_positive(int value)
{
    if (value <= 0)
        return Result<int, SampleErrc>::error(SampleErrc::Second, value, "not positive");
    return Result<int, SampleErrc>::ok(value);
}

} // namespace

TEST(ResultTest, OkCarriesValue)
{
    auto r = parse_positive(7);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 7);
}

TEST(ResultTest, ErrorCarriesCodeAndMessage)
{
    auto r = parse_positive(-3);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), SampleErrc::Second);
    EXPECT_EQ(r.error_code(), -3);
    EXPECT_EQ(r.error_message(), "not positive");
}

TEST(ResultTest, AccessorsOnWrongStateThrow)
{
    auto ok = parse_positive(1);
    auto bad = parse_positive(0);
    EXPECT_THROW((void)bad.content(), std::logic_error);
    EXPECT_THROW((void)ok.error_code(), std::logic_error);
    EXPECT_THROW((void)ok.error_message(), std::logic_error);
}

TEST(ResultTest, PropagateKeepsErrorDetail)
{
    auto bad = parse_positive(-1);
    auto forwarded = Result<std::string, SampleErrc>::propagate(bad);
    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error(), SampleErrc::Second);
    EXPECT_EQ(forwarded.error_code(), -1);
    EXPECT_EQ(forwarded.error_message(), "not positive");
}

TEST(ResultTest, MoveOnlyContentCanBeTaken)
{
    auto r = Result<std::unique_ptr<int>, SampleErrc>::ok(std::make_unique<int>(42));
    std::unique_ptr<int> taken = std::move(r).content();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST(ResultTest, StatusHasNoValue)
{
    auto ok = Status<SampleErrc>::ok();
    EXPECT_TRUE(ok.is_ok());
    auto bad = Status<SampleErrc>::error(SampleErrc::First);
    EXPECT_EQ(bad.error(), SampleErrc::First);
    EXPECT_EQ(bad.error_code(), 0);
    EXPECT_TRUE(bad.error_message().empty());
}
