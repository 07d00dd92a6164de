#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "pooled_http/error.hpp"
#include "pooled_http/result.hpp"

using pooled_http::Error;
using pooled_http::Result;

TEST(ResultTest, OkAndHasValue) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(r.has_error());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorAndHasError) {
    Error err{Error::Code::ConnectionFailed, "fail"};
    auto r = Result<int>::err(err);
    EXPECT_TRUE(r.has_error());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "fail");
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
    EXPECT_EQ(r.value_ptr(), nullptr);
}

TEST(ResultTest, HoldsMoveOnlyValues) {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(5));
    ASSERT_TRUE(r.has_value());
    std::unique_ptr<int> p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 5);
}

TEST(ResultTest, ValueOrElseReturnsValue) {
    auto r = Result<std::string>::ok("hello");
    auto val =
        std::move(r).value_or_else([] { return std::string("fallback"); });
    EXPECT_EQ(val, "hello");
}

TEST(ResultTest, ValueOrElseReturnsFallback) {
    auto r = Result<std::string>::err(Error::Code::Timeout, "fail");
    auto val =
        std::move(r).value_or_else([] { return std::string("fallback"); });
    EXPECT_EQ(val, "fallback");
}

TEST(ResultTest, ValueOrReturnsFallback) {
    auto r = Result<int>::err(Error::Code::ReceiveFailed, "fail");
    EXPECT_EQ(r.value_or(99), 99);
    EXPECT_EQ(Result<int>::ok(7).value_or(99), 7);
}

TEST(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::UnsupportedEncoding, "br");
    auto s = r.forward_error<std::string>();
    ASSERT_TRUE(s.has_error());
    EXPECT_EQ(s.error().code, Error::Code::UnsupportedEncoding);
    EXPECT_EQ(s.error().message, "br");
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(pooled_http::to_string(Error::Code::ParseError),
                 "ParseError");
    EXPECT_STREQ(pooled_http::to_string(Error::Code::PoolShutdown),
                 "PoolShutdown");
}
