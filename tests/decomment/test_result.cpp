#include <gtest/gtest.h>
#include <decomment/result.hpp>

using namespace decomment;

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_STREQ(Error::error_code_name(ErrorCode::OK), "OK");
    EXPECT_STREQ(Error::error_code_name(ErrorCode::NOT_FOUND), "NOT_FOUND");
    EXPECT_STREQ(Error::error_code_name(ErrorCode::IO_ERROR), "IO_ERROR");
    EXPECT_STREQ(Error::error_code_name(ErrorCode::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(Error::error_code_name(ErrorCode::UNKNOWN_LANGUAGE), "UNKNOWN_LANGUAGE");
}

TEST(ResultTest, ErrorToString) {
    EXPECT_EQ(Error(ErrorCode::IO_ERROR).to_string(), "IO_ERROR");
    EXPECT_EQ(Error(ErrorCode::NOT_FOUND, "a.py").to_string(), "NOT_FOUND: a.py");
    EXPECT_TRUE(Error().ok());
}

TEST(ResultTest, ValueAndError) {
    Result<std::string> good = std::string("text");
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(*good, "text");
    EXPECT_EQ(good.error_code(), ErrorCode::OK);
    EXPECT_THROW(good.error(), std::logic_error);

    Result<std::string> bad(ErrorCode::UNKNOWN_LANGUAGE, "Cobol");
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.value_or("fallback"), "fallback");
    EXPECT_THROW(bad.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(Ok().ok());

    Result<void> failed = Err(ErrorCode::IO_ERROR, "disk full");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().message(), "disk full");
    EXPECT_THROW(failed.value(), std::runtime_error);
}
