#include <gtest/gtest.h>
#include "bulkup/core/result.hpp"

#include <string>

using namespace bulkup;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(ErrorCode::InvalidArgument, "not positive: " + std::to_string(value));
    }
    return Ok(value);
}

} // namespace

TEST(Result, HoldsValue) {
    auto result = parse_positive(7);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(result.value_or(0), 7);
}

TEST(Result, HoldsError) {
    auto result = parse_positive(-1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "not positive: -1");
    EXPECT_EQ(result.value_or(42), 42);
}

TEST(Result, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>(OkValue<std::string>("fine"));
    auto err = Err<std::string, std::string>("broken");

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "fine");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "broken");
}

TEST(Result, MatchVisitsHeldAlternative) {
    auto describe = [](const Result<int>& r) {
        return r.match([](int v) { return "ok:" + std::to_string(v); },
                       [](const Error& e) { return "err:" + e.message; });
    };

    EXPECT_EQ(describe(parse_positive(3)), "ok:3");
    EXPECT_EQ(describe(parse_positive(0)), "err:not positive: 0");
}

TEST(Result, VoidSpecialization) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = Err<void>(ErrorCode::Io, "disk full");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().code, ErrorCode::Io);
    EXPECT_EQ(err.error().message, "disk full");
}

TEST(Result, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::RootNotFound), "root not found");
    EXPECT_EQ(to_string(ErrorCode::NotADirectory), "not a directory");
    EXPECT_EQ(to_string(ErrorCode::RemoteService), "remote service failure");
}
