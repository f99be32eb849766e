#include <gtest/gtest.h>

#include <cerrno>

#include "infra/error_handler/error.hpp"

using fcopy::infra::ErrorCode;
using fcopy::infra::make_error;
using fcopy::infra::make_os_error;
using fcopy::infra::code_from_errno;

TEST(ErrorTest, OsErrorKeepsOriginalErrno)
{
    auto err = make_os_error(ENOSPC, "Write failed");

    EXPECT_EQ(err.code, ErrorCode::DiskFull);
    EXPECT_EQ(err.os_errno(), ENOSPC);
    EXPECT_EQ(err.os_error, std::error_code(ENOSPC, std::system_category()));
    EXPECT_EQ(err.message.rfind("Write failed: ", 0), 0u);
}

TEST(ErrorTest, ErrnoMapping)
{
    EXPECT_EQ(code_from_errno(ENOENT), ErrorCode::FileNotFound);
    EXPECT_EQ(code_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(EPERM), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(ENOTSUP), ErrorCode::UnsupportedFeature);
    EXPECT_EQ(code_from_errno(EOPNOTSUPP), ErrorCode::UnsupportedFeature);
    EXPECT_EQ(code_from_errno(ETXTBSY), ErrorCode::FileLocked);
    EXPECT_EQ(code_from_errno(EIO), ErrorCode::Unknown);
}

TEST(ErrorTest, ValidationErrorsHaveNoOsError)
{
    auto err = make_error(ErrorCode::SameFile, "same");

    EXPECT_EQ(err.os_errno(), 0);
    EXPECT_TRUE(err.is_fatal());
    EXPECT_STREQ(err.what(), "same");
    EXPECT_NE(err.line, 0);
    EXPECT_FALSE(err.file.empty());
}

TEST(ErrorTest, OnlyValidationAndPathErrorsAreFatal)
{
    EXPECT_TRUE(make_error(ErrorCode::SpecialFile, "").is_fatal());
    EXPECT_TRUE(make_os_error(ENOENT, "open").is_fatal());
    EXPECT_FALSE(make_os_error(ENOSPC, "write").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::ChecksumMismatch, "").is_fatal());
}

TEST(ErrorTest, LogAndReturnPreservesError)
{
    auto err = fcopy::infra::log_and_return(make_os_error(EACCES, "open"));

    EXPECT_EQ(err.code, ErrorCode::PermissionDenied);
    EXPECT_EQ(err.os_errno(), EACCES);
}
