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

#ifndef STRUCTDIFF_BASE_RET_CHECK_H_
#define STRUCTDIFF_BASE_RET_CHECK_H_

// Macros for non-fatal assertions.  The `STRUCTDIFF_RET_CHECK` family of
// macros mirrors the `STRUCTDIFF_CHECK` family from "logging.h", but instead
// of aborting the process on failure, these return an absl::Status with code
// `absl::StatusCode::kInternal` from the current method.
//
//   STRUCTDIFF_RET_CHECK(ptr != nullptr);
//   STRUCTDIFF_RET_CHECK_GT(value, 0) << "Optional additional message";
//   STRUCTDIFF_RET_CHECK_FAIL() << "Always fails";
//
// The STRUCTDIFF_RET_CHECK* macros can only be used in functions that return
// absl::Status or absl::StatusOr.  The generated `absl::Status` will contain
// the string "STRUCTDIFF_RET_CHECK failure".  Failures are logged at ERROR.

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"

namespace structdiff_base {
namespace internal_ret_check {

// Returns a StatusBuilder that corresponds to a `STRUCTDIFF_RET_CHECK`
// failure.
StatusBuilder RetCheckFailSlowPath(const char* file, int line);
StatusBuilder RetCheckFailSlowPath(const char* file, int line,
                                   const char* condition);

}  // namespace internal_ret_check
}  // namespace structdiff_base

#define STRUCTDIFF_RET_CHECK(cond)                                        \
  while (ABSL_PREDICT_FALSE(!(cond)))                                     \
  return ::structdiff_base::internal_ret_check::RetCheckFailSlowPath(     \
      __FILE__, __LINE__, #cond)

#define STRUCTDIFF_RET_CHECK_FAIL()                                      \
  return ::structdiff_base::internal_ret_check::RetCheckFailSlowPath(    \
      __FILE__, __LINE__)

#define STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(name, op, lhs, rhs) \
  STRUCTDIFF_RET_CHECK((lhs)op(rhs))

#define STRUCTDIFF_RET_CHECK_EQ(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(EQ, ==, lhs, rhs)
#define STRUCTDIFF_RET_CHECK_NE(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(NE, !=, lhs, rhs)
#define STRUCTDIFF_RET_CHECK_LE(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LE, <=, lhs, rhs)
#define STRUCTDIFF_RET_CHECK_LT(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LT, <, lhs, rhs)
#define STRUCTDIFF_RET_CHECK_GE(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GE, >=, lhs, rhs)
#define STRUCTDIFF_RET_CHECK_GT(lhs, rhs) \
  STRUCTDIFF_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GT, >, lhs, rhs)

#endif  // STRUCTDIFF_BASE_RET_CHECK_H_
