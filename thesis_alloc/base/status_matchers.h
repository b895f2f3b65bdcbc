// Copyright 2010-2025 Google LLC
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

// gMock matchers and assertion macros for absl::Status and absl::StatusOr<T>,
// for use in tests only.
//
//   EXPECT_THAT(allocator->Solve(), StatusIs(absl::StatusCode::kInternal));
//   ASSERT_OK_AND_ASSIGN(const AllocationResult result, allocator->Solve());

#ifndef THESIS_ALLOC_BASE_STATUS_MATCHERS_H_
#define THESIS_ALLOC_BASE_STATUS_MATCHERS_H_

#include <ostream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "thesis_alloc/base/status_macros.h"

namespace testing::status {

inline const ::absl::Status& GetStatus(const ::absl::Status& status) {
  return status;
}

template <typename T>
inline const ::absl::Status& GetStatus(const ::absl::StatusOr<T>& status) {
  return status.status();
}

namespace internal {

// Implements IsOk() for Status, StatusOr<> and references to them.
template <typename T>
class MonoIsOkMatcherImpl : public ::testing::MatcherInterface<T> {
 public:
  void DescribeTo(std::ostream* os) const override { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not OK";
  }
  bool MatchAndExplain(
      T actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    const ::absl::Status& status = GetStatus(actual_value);
    if (!status.ok()) *result_listener << "which has status " << status;
    return status.ok();
  }
};

class IsOkMatcher {
 public:
  template <typename T>
  operator ::testing::Matcher<T>() const {  // NOLINT
    return ::testing::Matcher<T>(new MonoIsOkMatcherImpl<T>());
  }
};

// Implements StatusIs(code) and StatusIs(code, message_matcher).
template <typename T>
class MonoStatusIsMatcherImpl : public ::testing::MatcherInterface<T> {
 public:
  MonoStatusIsMatcherImpl(
      ::absl::StatusCode code,
      ::testing::Matcher<const std::string&> message_matcher)
      : code_(code), message_matcher_(std::move(message_matcher)) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "has status code " << ::absl::StatusCodeToString(code_)
        << " and an error message that ";
    message_matcher_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "does not have status code " << ::absl::StatusCodeToString(code_)
        << " or has an error message that ";
    message_matcher_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      T actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    const ::absl::Status& status = GetStatus(actual_value);
    if (status.code() != code_) {
      *result_listener << "whose status is " << status;
      return false;
    }
    if (!message_matcher_.Matches(std::string(status.message()))) {
      *result_listener << "whose error message is wrong";
      return false;
    }
    return true;
  }

 private:
  const ::absl::StatusCode code_;
  const ::testing::Matcher<const std::string&> message_matcher_;
};

class StatusIsMatcher {
 public:
  StatusIsMatcher(::absl::StatusCode code,
                  ::testing::Matcher<const std::string&> message_matcher)
      : code_(code), message_matcher_(std::move(message_matcher)) {}

  template <typename T>
  operator ::testing::Matcher<T>() const {  // NOLINT
    return ::testing::Matcher<T>(
        new MonoStatusIsMatcherImpl<T>(code_, message_matcher_));
  }

 private:
  const ::absl::StatusCode code_;
  const ::testing::Matcher<const std::string&> message_matcher_;
};

}  // namespace internal

// Returns a gMock matcher that matches a Status or StatusOr<> which is OK.
inline internal::IsOkMatcher IsOk() { return internal::IsOkMatcher(); }

// Returns a gMock matcher that matches a Status or StatusOr<> whose code is
// `code` and whose message matches `message_matcher`.
inline internal::StatusIsMatcher StatusIs(
    ::absl::StatusCode code,
    ::testing::Matcher<const std::string&> message_matcher = ::testing::_) {
  return internal::StatusIsMatcher(code, std::move(message_matcher));
}

}  // namespace testing::status

#define EXPECT_OK(expression) \
  EXPECT_THAT(expression, ::testing::status::IsOk())
#define ASSERT_OK(expression) \
  ASSERT_THAT(expression, ::testing::status::IsOk())

#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                   \
  STATUS_MATCHERS_IMPL_ASSERT_OK_AND_ASSIGN_(                              \
      STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __COUNTER__), lhs, \
      rexpr)

#define STATUS_MATCHERS_IMPL_ASSERT_OK_AND_ASSIGN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                               \
  ASSERT_TRUE(statusor.status().ok()) << statusor.status();              \
  lhs = std::move(statusor).value()

#endif  // THESIS_ALLOC_BASE_STATUS_MATCHERS_H_
