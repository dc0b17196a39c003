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

#ifndef STRUCTDIFF_BASE_STATUS_BUILDER_H_
#define STRUCTDIFF_BASE_STATUS_BUILDER_H_

#include <sstream>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace structdiff_base {

// Creates a status based on an original_status, but enriched with additional
// information.  The builder implicitly converts to absl::Status, which in
// turn lets it be returned directly from functions returning
// absl::StatusOr<T>.
//
//   return InvalidArgumentErrorBuilder() << "unhashable map key " << key;
//
// It provides method chaining to simplify typical usage:
//
//   return StatusBuilder(original).LogWarning() << "oh no!";
//
// - When the original status is OK, all methods become no-ops and nothing will
//   be logged.
// - Messages streamed into the builder are joined to the original message
//   with a "; " separator (or replace it if the original message is empty).
// - All side effects (like logging) happen when the builder is converted to a
//   status.
class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  explicit StatusBuilder(absl::StatusCode code);
  explicit StatusBuilder(const absl::Status& original_status);
  explicit StatusBuilder(absl::Status&& original_status);

  StatusBuilder(const StatusBuilder& sb);
  StatusBuilder& operator=(const StatusBuilder& sb);
  StatusBuilder(StatusBuilder&&) = default;
  StatusBuilder& operator=(StatusBuilder&&) = default;

  // Mutates the builder so that the result status will be logged when this
  // builder is converted to a Status.  Returns `*this` to allow method
  // chaining.
  StatusBuilder& Log(absl::LogSeverity level);
  StatusBuilder& LogError() { return Log(absl::LogSeverity::kError); }
  StatusBuilder& LogWarning() { return Log(absl::LogSeverity::kWarning); }
  StatusBuilder& LogInfo() { return Log(absl::LogSeverity::kInfo); }

  // Appends to the extra message that will be added to the original status.
  template <typename T>
  StatusBuilder& operator<<(const T& value) {
    if (status_.ok()) return *this;
    stream_ << value;
    return *this;
  }

  // Sets the error code for the status that will be returned by this
  // StatusBuilder.  Returns `*this` to allow method chaining.
  StatusBuilder& SetErrorCode(absl::StatusCode code);

  // Returns true if the Status created by this builder will be ok().
  bool ok() const { return status_.ok(); }

  // Returns the code for the Status created by this builder.
  absl::StatusCode code() const { return status_.code(); }

  // Implicit conversion to Status.
  //
  // Careful: this operator has side effects, so it should be called at
  // most once.
  operator absl::Status() const&;  // NOLINT
  operator absl::Status() &&;      // NOLINT

 private:
  // Creates a new status based on an old one by joining the message from the
  // original to an additional message.
  static absl::Status JoinMessageToStatus(absl::Status s,
                                          absl::string_view msg);

  // Creates a Status from this builder and logs it if the builder has been
  // configured to log itself.
  absl::Status CreateStatusAndConditionallyLog() const;

  // The status that the result will be based on.
  absl::Status status_;

  // Gathers additional messages added with `<<` for use in the final status.
  std::ostringstream stream_;

  bool should_log_ = false;
  absl::LogSeverity log_severity_ = absl::LogSeverity::kInfo;
};

// Each of the functions below creates StatusBuilder with a canonical error.
// The error code of the StatusBuilder matches the name of the function.
StatusBuilder FailedPreconditionErrorBuilder();
StatusBuilder InternalErrorBuilder();
StatusBuilder InvalidArgumentErrorBuilder();
StatusBuilder OutOfRangeErrorBuilder();
StatusBuilder ResourceExhaustedErrorBuilder();
StatusBuilder UnimplementedErrorBuilder();

}  // namespace structdiff_base

#endif  // STRUCTDIFF_BASE_STATUS_BUILDER_H_
