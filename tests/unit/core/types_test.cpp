#include <gtest/gtest.h>

#include <fmt/format.h>
#include <set>
#include <string>
#include <wirebind/core/types.h>

using namespace wirebind;

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    Result<std::string> r = Error{ErrorCode::DecodeError, "bad input"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DecodeError);
    EXPECT_EQ(r.error().message, "bad input");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidDefaultsToSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> failed = ErrorCode::InvalidArgument;
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "Invalid argument");
}

TEST(ErrorTest, ComparesAgainstCode) {
    Error e{ErrorCode::ParseError, "truncated"};
    EXPECT_TRUE(e == ErrorCode::ParseError);
    EXPECT_TRUE(ErrorCode::ParseError == e);
    EXPECT_TRUE(e != ErrorCode::DecodeError);
}

TEST(ErrorTest, WrapKeepsFieldAndCause) {
    Error cause{ErrorCode::EncodeError, "Non-finite double cannot be encoded"};
    auto wrapped = Error::wrap(ErrorCode::MarshallError, "ratio", cause, "Unable to marshall field");

    EXPECT_EQ(wrapped.code, ErrorCode::MarshallError);
    EXPECT_EQ(wrapped.field, "ratio");
    EXPECT_EQ(wrapped.message,
              "Unable to marshall field 'ratio': Non-finite double cannot be encoded");
    ASSERT_NE(wrapped.cause, nullptr);
    EXPECT_EQ(wrapped.cause->code, ErrorCode::EncodeError);
}

TEST(ErrorTest, RootWalksTheWholeChain) {
    Error inner{ErrorCode::DecodeError, "Invalid base64"};
    auto middle = Error::wrap(ErrorCode::ParseError, "data", inner, "Unable to unmarshall field");
    auto outer = Error::wrap(ErrorCode::ParseError, "attachment", middle,
                             "Unable to unmarshall field");

    EXPECT_EQ(outer.root().code, ErrorCode::DecodeError);
    EXPECT_EQ(outer.root().message, "Invalid base64");
    EXPECT_NE(outer.message.find("'attachment'"), std::string::npos);
    EXPECT_NE(outer.message.find("'data'"), std::string::npos);
}

TEST(ErrorCodeTest, FormatsThroughFmt) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::MarshallError), "Marshall error");
    EXPECT_STREQ(errorToString(ErrorCode::ParseError), "Parse error");
}

TEST(ErrorCodeTest, EveryCodeHasItsOwnName) {
    std::set<std::string> names;
    for (auto code : {ErrorCode::Success, ErrorCode::InvalidArgument, ErrorCode::InvalidState,
                      ErrorCode::EncodeError, ErrorCode::DecodeError, ErrorCode::MarshallError,
                      ErrorCode::ParseError, ErrorCode::NotFound, ErrorCode::InternalError}) {
        std::string name = errorToString(code);
        EXPECT_NE(name, "Unknown error");
        EXPECT_TRUE(names.insert(name).second) << name;
    }
    EXPECT_EQ(fmt::format("{}", ErrorCode::MarshallError), "Marshall error");
}
