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

#ifndef STRUCTDIFF_BASE_STATUS_MACROS_H_
#define STRUCTDIFF_BASE_STATUS_MACROS_H_

// Helper macros and methods to return and propagate errors with
// `absl::Status`.

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "structdiff/base/status_builder.h"

// Evaluates an expression that produces a `absl::Status`. If the status
// is not ok, returns it from the current function.
//
// For example:
//   absl::Status MultiStepFunction() {
//     STRUCTDIFF_RETURN_IF_ERROR(Function(args...));
//     STRUCTDIFF_RETURN_IF_ERROR(foo.Method(args...)) << "in MultiStep";
//     return absl::OkStatus();
//   }
//
// The macro ends with a `structdiff_base::StatusBuilder` which allows the
// returned status to be extended with more details.  Any chained expressions
// after the macro will not be evaluated unless there is an error.
//
// If using this macro inside a lambda, you need to annotate the return type
// to avoid confusion between a `structdiff_base::StatusBuilder` and a
// `absl::Status` type.
#define STRUCTDIFF_RETURN_IF_ERROR(expr)                           \
  STRUCTDIFF_STATUS_MACROS_IMPL_ELSE_BLOCKER_                      \
  if (::structdiff_base::status_macro_internal::                   \
          StatusAdaptorForMacros status_macro_internal_adaptor = { \
              (expr)}) {                                           \
  } else /* NOLINT */                                              \
    return status_macro_internal_adaptor.Consume()

// Executes an expression `rexpr` that returns an `absl::StatusOr<T>`. On OK,
// extracts its value into the variable defined by `lhs`, otherwise returns
// from the current function. By default the error status is returned
// unchanged, but it may be modified by an `error_expression`. If there is an
// error, `lhs` is not evaluated; thus any side effects that `lhs` may have
// only occur in the success case.
//
// Interface:
//
//   STRUCTDIFF_ASSIGN_OR_RETURN(lhs, rexpr)
//   STRUCTDIFF_ASSIGN_OR_RETURN(lhs, rexpr, error_expression);
//
// WARNING: expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
//
// Example: Declaring and initializing a new variable:
//   STRUCTDIFF_ASSIGN_OR_RETURN(ValueType value, MaybeGetValue(arg));
//
// If passed, the `error_expression` is evaluated to produce the return
// value. The expression may reference any variable visible in scope, as
// well as a `structdiff_base::StatusBuilder` object populated with the error
// and named by a single underscore `_`:
//
//   STRUCTDIFF_ASSIGN_OR_RETURN(ValueType value, MaybeGetValue(query),
//                               _ << "while processing " << query);
#define STRUCTDIFF_ASSIGN_OR_RETURN(...)                  \
  STRUCTDIFF_STATUS_MACROS_IMPL_GET_VARIADIC_(            \
      __VA_ARGS__,                                        \
      STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_,  \
      STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_)  \
  (__VA_ARGS__)

// =================================================================
// == Implementation details, do not rely on anything below here. ==
// =================================================================

#define STRUCTDIFF_STATUS_MACROS_IMPL_GET_VARIADIC_(_1, _2, _3, NAME, ...) \
  NAME

#define STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_(lhs, rexpr) \
  STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr, std::move(_))
#define STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr,      \
                                                          error_expression) \
  STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                          \
      STRUCTDIFF_STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __LINE__),    \
      lhs, rexpr, error_expression)
#define STRUCTDIFF_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr, \
                                                        error_expression)     \
  auto statusor = (rexpr);                                                    \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                                   \
    ::structdiff_base::StatusBuilder _(std::move(statusor).status());         \
    (void)_; /* error_expression is allowed to not use this variable */       \
    return (error_expression);                                                \
  }                                                                           \
  lhs = std::move(statusor).value()

// Internal helper for concatenating macro values.
#define STRUCTDIFF_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define STRUCTDIFF_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  STRUCTDIFF_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

// The GNU compiler emits a warning for code like:
//
//   if (foo)
//     if (bar) { } else baz;
//
// because it thinks you might want the else to bind to the first if.  The
// "switch (0) case 0:" idiom is used to suppress this.
#define STRUCTDIFF_STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                                        \
  case 0:                                           \
  default:  // NOLINT

namespace structdiff_base {
namespace status_macro_internal {

// Provides a conversion to bool so that it can be used inside an if statement
// that declares a variable.
class StatusAdaptorForMacros {
 public:
  StatusAdaptorForMacros(const absl::Status& status) : builder_(status) {}

  StatusAdaptorForMacros(absl::Status&& status)
      : builder_(std::move(status)) {}

  StatusAdaptorForMacros(const StatusBuilder& builder) : builder_(builder) {}

  StatusAdaptorForMacros(StatusBuilder&& builder)
      : builder_(std::move(builder)) {}

  StatusAdaptorForMacros(const StatusAdaptorForMacros&) = delete;
  StatusAdaptorForMacros& operator=(const StatusAdaptorForMacros&) = delete;

  explicit operator bool() const { return ABSL_PREDICT_TRUE(builder_.ok()); }

  StatusBuilder&& Consume() { return std::move(builder_); }

 private:
  StatusBuilder builder_;
};

}  // namespace status_macro_internal
}  // namespace structdiff_base

#endif  // STRUCTDIFF_BASE_STATUS_MACROS_H_
