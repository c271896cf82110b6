#include <gtest/gtest.h>
#include <cerrno>
#include <string>
#include "core/result.hpp"

using namespace netfs;

TEST(ErrorTest, ErrnoMapping) {
  EXPECT_EQ(error_from_errno(ENOENT, "x").reason, ErrorReason::NOT_FOUND);
  EXPECT_EQ(error_from_errno(ENOENT, "x").kind, ErrorKind::PROTOCOL_ERROR);
  EXPECT_EQ(error_from_errno(EACCES, "x").reason, ErrorReason::PERMISSION_DENIED);
  EXPECT_EQ(error_from_errno(EDQUOT, "x").reason, ErrorReason::QUOTA_EXCEEDED);
  EXPECT_EQ(error_from_errno(ENOSPC, "x").kind, ErrorKind::IO_ERROR);
  EXPECT_EQ(error_from_errno(ENOSPC, "x").reason, ErrorReason::DISK_FULL);
  EXPECT_EQ(error_from_errno(EEXIST, "x").reason, ErrorReason::DESTINATION_EXISTS);
  EXPECT_EQ(error_from_errno(ETIMEDOUT, "x").kind, ErrorKind::CONNECTION_ERROR);
  EXPECT_EQ(error_from_errno(ECONNREFUSED, "x").reason, ErrorReason::UNREACHABLE);
  EXPECT_EQ(error_from_errno(EPIPE, "x").reason, ErrorReason::DISCONNECTED);
  EXPECT_EQ(error_from_errno(EIO, "x").kind, ErrorKind::IO_ERROR);
  EXPECT_EQ(error_from_errno(EXDEV, "x").reason, ErrorReason::CROSS_DEVICE);
}

TEST(ErrorTest, OnlyDroppedOrSlowTransportsAreRetryable) {
  EXPECT_TRUE(make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::TIMEOUT, "t").is_retryable());
  EXPECT_TRUE(make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, "d").is_retryable());
  EXPECT_FALSE(make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::AUTH_FAILED, "a").is_retryable());
  EXPECT_FALSE(make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "n").is_retryable());
}

TEST(ErrorTest, ToStringCarriesCause) {
  const auto error = make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "No such file", "550 gone");
  const std::string text = error.to_string();
  EXPECT_NE(text.find("Protocol error"), std::string::npos);
  EXPECT_NE(text.find("not found"), std::string::npos);
  EXPECT_NE(text.find("550 gone"), std::string::npos);
}

TEST(ResultTest, SuccessAndFailure) {
  auto good = Result<int>::success(7);
  ASSERT_TRUE(good.ok());
  EXPECT_EQ(good.value(), 7);
  EXPECT_THROW(good.error(), std::logic_error);

  Result<int> bad = make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "boom");
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(bad.error().message, "boom");
  EXPECT_EQ(bad.value_or(3), 3);
  EXPECT_THROW(bad.value(), std::logic_error);

  Result<void> done = Result<void>::success();
  EXPECT_TRUE(done.ok());
  Result<void> failed = make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED, "stop");
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(failed.error().kind, ErrorKind::CANCELLED);
}
