#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <sharemirror/expected.h>
#include <sharemirror/types.h>

using namespace sharemirror;

TEST(Error, kinds)
{
    EXPECT_EQ(ErrorKind::NONE, Error(API_OK).kind());
    EXPECT_EQ(ErrorKind::NOT_FOUND, Error(API_ENOENT).kind());
    EXPECT_EQ(ErrorKind::SERVICE, Error(API_EFAILED).kind());
    EXPECT_EQ(ErrorKind::SERVICE, Error(API_ECIRCULAR).kind());
    EXPECT_EQ(ErrorKind::TRANSIENT, Error(API_EAGAIN).kind());
    EXPECT_EQ(ErrorKind::TRANSIENT, Error(LOCAL_ETIMEOUT).kind());
    EXPECT_EQ(ErrorKind::RANGE, Error(API_ERANGE).kind());
    EXPECT_EQ(ErrorKind::LOCAL, Error(API_EWRITE).kind());
    EXPECT_EQ(ErrorKind::LOCAL, Error(API_EINCOMPLETE).kind());
    EXPECT_EQ(ErrorKind::LOCAL, Error(LOCAL_ECANCELLED).kind());
}

TEST(Error, onlyTransientErrorsAreRetryable)
{
    EXPECT_TRUE(Error(API_EAGAIN).retryable());
    EXPECT_TRUE(Error(LOCAL_ETIMEOUT).retryable());
    EXPECT_FALSE(Error(API_EFAILED).retryable());
    EXPECT_FALSE(Error(API_ERANGE).retryable());
    EXPECT_FALSE(Error(API_ENOENT).retryable());
}

TEST(Error, annotate)
{
    Error error(API_EWRITE);

    error.annotate("dir/file");
    EXPECT_EQ("dir/file", error.message());

    error.annotate("root");
    EXPECT_EQ("root: dir/file", error.message());
    EXPECT_EQ(API_EWRITE, error);
}

TEST(Error, describe)
{
    EXPECT_EQ("RangeError (Not available)", Error(API_ERANGE).describe());
    EXPECT_EQ("ServiceError (Request failed permanently): HTTP 403",
              Error(API_EFAILED, "HTTP 403").describe());
}

TEST(Expected, holdsValue)
{
    ErrorOr<int> result = 42;

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(42, *result);
    EXPECT_EQ(42, result.valueOr(0));
}

TEST(Expected, holdsError)
{
    ErrorOr<int> result = unexpected(Error(API_ENOENT, "x"));

    ASSERT_FALSE(result);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(API_ENOENT, result.error());
    EXPECT_EQ("x", result.error().message());
    EXPECT_EQ(7, result.valueOr(7));
}

TEST(Expected, moveOnlyValues)
{
    ErrorOr<std::unique_ptr<int>> result = std::make_unique<int>(3);

    ASSERT_TRUE(result);

    auto value = std::move(result).value();

    ASSERT_TRUE(value);
    EXPECT_EQ(3, *value);
}
