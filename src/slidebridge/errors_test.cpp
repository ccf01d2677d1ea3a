// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "slidebridge/errors.h"

#include <gtest/gtest.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/status/status_macros.h"

namespace slidebridge {
namespace {

absl::Status FailWithKind(ErrorKind kind) {
  return MAKE_ERROR(kind, "root cause");
}

absl::Status PropagateOnce(ErrorKind kind) {
  RETURN_IF_ERROR(FailWithKind(kind), "while propagating");
  return absl::OkStatus();
}

absl::StatusOr<int> PropagateThroughStatusOr(ErrorKind kind) {
  absl::StatusOr<int> value = FailWithKind(kind);
  DECLARE_ASSIGN_OR_RETURN(int, result, value);
  return result + 1;
}

TEST(ErrorsTest, StatusCodeFollowsKind) {
  EXPECT_EQ(GetStatusCode(ErrorKind::kOpenError),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(GetStatusCode(ErrorKind::kUseAfterClose),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(GetStatusCode(ErrorKind::kInvalidLevel),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(GetStatusCode(ErrorKind::kRegionOutOfBounds),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(GetStatusCode(ErrorKind::kNativeError),
            absl::StatusCode::kInternal);
  EXPECT_EQ(GetStatusCode(ErrorKind::kVendorUnknown),
            absl::StatusCode::kNotFound);
}

TEST(ErrorsTest, MakeErrorTagsKindAndCode) {
  const absl::Status status = FailWithKind(ErrorKind::kInvalidLevel);

  EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kInvalidLevel);
  EXPECT_TRUE(IsErrorKind(status, ErrorKind::kInvalidLevel));
  EXPECT_FALSE(IsErrorKind(status, ErrorKind::kRegionOutOfBounds));
}

TEST(ErrorsTest, KindSurvivesPropagation) {
  const absl::Status status = PropagateOnce(ErrorKind::kNativeError);

  EXPECT_EQ(GetErrorKind(status), ErrorKind::kNativeError);
  EXPECT_EQ(GetRootMessage(status), "root cause");
  EXPECT_NE(status.message().find("while propagating"), std::string::npos);
}

TEST(ErrorsTest, KindSurvivesStatusOrPropagation) {
  const absl::StatusOr<int> result =
      PropagateThroughStatusOr(ErrorKind::kUseAfterClose);

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(GetErrorKind(result), ErrorKind::kUseAfterClose);
}

TEST(ErrorsTest, UntaggedStatusHasNoKind) {
  EXPECT_EQ(GetErrorKind(absl::OkStatus()), std::nullopt);
  EXPECT_EQ(GetErrorKind(absl::NotFoundError("plain")), std::nullopt);
}

TEST(ErrorsTest, TagErrorLeavesOkStatusAlone) {
  EXPECT_TRUE(TagError(absl::OkStatus(), ErrorKind::kOpenError).ok());
}

TEST(ErrorsTest, RootMessageOfUntracedStatus) {
  EXPECT_EQ(GetRootMessage(absl::InternalError("plain text")), "plain text");
}

TEST(ErrorsTest, KindNames) {
  EXPECT_STREQ(GetName(ErrorKind::kOpenError), "OpenError");
  EXPECT_STREQ(GetName(ErrorKind::kUseAfterClose), "UseAfterClose");
  EXPECT_STREQ(GetName(ErrorKind::kVendorUnknown), "VendorUnknown");
}

}  // namespace
}  // namespace slidebridge
