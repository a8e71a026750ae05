#include <gtest/gtest.h>

#include "infra/error_handler/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>

using rcopy::infra::ErrorCode;
using rcopy::infra::code_from_errno;
using rcopy::infra::make_error;
using rcopy::infra::make_error_from;

TEST(ErrorTest, SessionLevelCodesAreFatal)
{
    EXPECT_TRUE(make_error(ErrorCode::InvalidPath, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::LedgerIOFailed, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::FileNotFound, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::VerificationFailed, "x").is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "x").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::InvalidPath, "x").to_exit_code(), EXIT_FAILURE);
}

TEST(ErrorTest, ErrnoMapping)
{
    EXPECT_EQ(code_from_errno(ENOENT), ErrorCode::FileNotFound);
    EXPECT_EQ(code_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(ENOSPC), ErrorCode::DiskFull);
    EXPECT_EQ(code_from_errno(EIO), ErrorCode::IOFailure);
}

TEST(ErrorTest, ErrorCodeConversionKeepsContext)
{
    auto err = make_error_from(std::make_error_code(std::errc::permission_denied), "Cannot create directory /dst");
    EXPECT_EQ(err.code, ErrorCode::PermissionDenied);
    EXPECT_EQ(err.kind_name(), "PermissionDenied");
    EXPECT_EQ(err.message.rfind("Cannot create directory /dst: ", 0), 0u);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    auto err = make_error(ErrorCode::Unknown, "x");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
}
