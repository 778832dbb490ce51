#include "rangepart/core/errors.h"
#include <gtest/gtest.h>

using namespace rangepart;

TEST(Errors, KindNames)
{
    EXPECT_EQ(to_string(ErrorKind::None), "None");
    EXPECT_EQ(to_string(ErrorKind::InvalidInput), "InvalidInput");
    EXPECT_EQ(to_string(ErrorKind::NotFound), "NotFound");
    EXPECT_EQ(to_string(ErrorKind::AccessDenied), "AccessDenied");
    EXPECT_EQ(to_string(ErrorKind::TransientIO), "TransientIOError");
    EXPECT_EQ(to_string(ErrorKind::PublishFailure), "PublishFailure");
    EXPECT_EQ(to_string(ErrorKind::Cancelled), "Cancelled");
    EXPECT_EQ(to_string(ErrorKind::Internal), "Internal");
}

TEST(Errors, SubclassesCarryKind)
{
    EXPECT_EQ(InvalidInputError("x").kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(BrokerError("x").kind(), ErrorKind::PublishFailure);
    EXPECT_EQ(ConfigError("x").kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(
        StorageError(ErrorKind::AccessDenied, "x").kind(),
        ErrorKind::AccessDenied);
}

TEST(Errors, OnlyTransientStorageErrorsAreRetryable)
{
    EXPECT_TRUE(StorageError(ErrorKind::TransientIO, "timeout").retryable());
    EXPECT_FALSE(StorageError(ErrorKind::NotFound, "gone").retryable());
    EXPECT_FALSE(StorageError(ErrorKind::AccessDenied, "no").retryable());
}

TEST(Errors, CaughtAsRuntimeError)
{
    try
    {
        throw StorageError(ErrorKind::NotFound, "No such object: a/b");
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "No such object: a/b");
    }
}
