#include "pulse/Result.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace pulse;

TEST(ResultTest, VoidSuccess) {
    Result<void> r;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_FALSE(r.is(ErrorCode::Closed));
}

TEST(ResultTest, VoidClosed) {
    Result<void> r = Error::closed();
    EXPECT_FALSE(r);
    EXPECT_TRUE(r.is(ErrorCode::Closed));
    EXPECT_EQ(r.error().code, ErrorCode::Closed);
    EXPECT_EQ(r.error().describe(), "ticker already closed");
}

TEST(ResultTest, ValueAndError) {
    Result<std::string> ok(std::string("x"));
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, "x");

    Result<std::string> bad(Error::closed());
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Closed);
}
