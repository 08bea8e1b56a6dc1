#include <gtest/gtest.h>

#include <cstdlib>

#include "infra/error_handler/error.hpp"

using copysort::infra::ErrorCode;
using copysort::infra::make_error;

TEST(ErrorTest, StartupErrorsAreFatal)
{
    EXPECT_TRUE(make_error(ErrorCode::InvalidArguments, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::HomeNotFound, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::ManifestUnavailable, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::InvalidConfig, "x").is_fatal());
}

TEST(ErrorTest, PerJobErrorsAreNotFatal)
{
    EXPECT_FALSE(make_error(ErrorCode::FileNotFound, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::WriteFailed, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::NoMetadata, "x").is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InvalidArguments, "x").to_exit_code(), 2);
    EXPECT_EQ(make_error(ErrorCode::ManifestUnavailable, "x").to_exit_code(), EXIT_FAILURE);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    auto err = make_error(ErrorCode::Unknown, "boom");
    EXPECT_STREQ(err.what(), "boom");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, LogAndReturnKeepsError)
{
    auto err = copysort::infra::log_and_return(make_error(ErrorCode::ReadFailed, "short read"));
    EXPECT_EQ(err.code, ErrorCode::ReadFailed);
    EXPECT_EQ(err.message, "short read");
}

TEST(ErrorTest, SystemErrorIncludesContext)
{
    auto err = copysort::infra::make_system_error(ErrorCode::PermissionDenied, "Cannot open /x",
                                                  std::make_error_code(std::errc::permission_denied));
    EXPECT_EQ(err.code, ErrorCode::PermissionDenied);
    EXPECT_EQ(err.message.rfind("Cannot open /x: ", 0), 0u);
}
