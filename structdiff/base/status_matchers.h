//
// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef STRUCTDIFF_BASE_STATUS_MATCHERS_H_
#define STRUCTDIFF_BASE_STATUS_MATCHERS_H_

// Testing utilities for working with ::absl::Status and absl::StatusOr.
//
//   =================
//   STRUCTDIFF_EXPECT_OK(s)
//   STRUCTDIFF_ASSERT_OK(s)
//   =================
//   Convenience macros for `EXPECT_THAT(s, IsOk())`, where `s` is either
//   a `Status` or a `StatusOr<T>`.
//
//   ===============
//   IsOkAndHolds(m)
//   ===============
//   Matches a StatusOr<T> value whose status is OK and whose inner value
//   matches matcher m.
//
//     EXPECT_THAT(registry.Extract(a, b), IsOkAndHolds(IsEmpty()));
//
//   ===============================
//   StatusIs(code)
//   StatusIs(code, message_matcher)
//   ===============================
//   Matches a Status or StatusOr<T> whose code equals `code` and, for the
//   two-argument form, whose message matches `message_matcher`.
//
//     EXPECT_THAT(extractor.Extract(...),
//                 StatusIs(absl::StatusCode::kInvalidArgument,
//                          HasSubstr("unhashable")));
//
//   ===============
//   IsOk()
//   ===============
//   Matches a absl::Status or absl::StatusOr<T> value whose status value is
//   StatusCode::kOk.

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"

#define STRUCTDIFF_EXPECT_OK(expression) \
  EXPECT_THAT(expression, ::structdiff_base::testing::IsOk())
#define STRUCTDIFF_ASSERT_OK(expression) \
  ASSERT_THAT(expression, ::structdiff_base::testing::IsOk())

namespace structdiff_base {
namespace testing {
namespace internal_status {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

inline void AddFatalFailure(absl::string_view expression,
                            const StatusBuilder& builder) {
  GTEST_MESSAGE_(
      std::string("Expression ")
          .append(expression.data(), expression.size())
          .append(" returned error: ")
          .append(static_cast<absl::Status>(builder).ToString())
          .c_str(),
      ::testing::TestPartResult::kFatalFailure);
}

}  // namespace internal_status

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  const absl::Status& status = internal_status::GetStatus(arg);
  if (!status.ok()) *result_listener << "whose status is " << status;
  return status.ok();
}

MATCHER_P(StatusIs, code, "") {
  const absl::Status& status = internal_status::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code;
}

MATCHER_P2(StatusIs, code, message_matcher, "") {
  const absl::Status& status = internal_status::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code &&
         ::testing::ExplainMatchResult(
             message_matcher, std::string(status.message()), result_listener);
}

MATCHER_P(IsOkAndHolds, value_matcher, "") {
  if (!arg.ok()) {
    *result_listener << "whose status is " << arg.status();
    return false;
  }
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

}  // namespace testing
}  // namespace structdiff_base

// Executes an expression that returns an absl::StatusOr, and assigns the
// contained variable to lhs if the error code is OK. If the Status is non-OK,
// generates a test failure and returns from the current function, which must
// have a void return type.
//
//   STRUCTDIFF_ASSERT_OK_AND_ASSIGN(const ValueType& value,
//                                   MaybeGetValue(arg));
//
// WARNING: Like STRUCTDIFF_ASSIGN_OR_RETURN, this expands into multiple
// statements; it cannot be used in a single statement (e.g. as the body of an
// if statement without {})!
#define STRUCTDIFF_ASSERT_OK_AND_ASSIGN(lhs, rexpr)                    \
  STRUCTDIFF_ASSIGN_OR_RETURN(                                         \
      lhs, rexpr,                                                      \
      ::structdiff_base::testing::internal_status::AddFatalFailure(    \
          #rexpr, _))

#endif  // STRUCTDIFF_BASE_STATUS_MATCHERS_H_
