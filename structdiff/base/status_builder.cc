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

#include "structdiff/base/status_builder.h"

#include <string>
#include <utility>

#include "absl/base/log_severity.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/logging.h"

namespace structdiff_base {

StatusBuilder::StatusBuilder(absl::StatusCode code)
    : status_(code, "") {}

StatusBuilder::StatusBuilder(const absl::Status& original_status)
    : status_(original_status) {}

StatusBuilder::StatusBuilder(absl::Status&& original_status)
    : status_(std::move(original_status)) {}

StatusBuilder::StatusBuilder(const StatusBuilder& sb)
    : status_(sb.status_),
      should_log_(sb.should_log_),
      log_severity_(sb.log_severity_) {
  stream_ << sb.stream_.str();
}

StatusBuilder& StatusBuilder::operator=(const StatusBuilder& sb) {
  status_ = sb.status_;
  stream_.str(sb.stream_.str());
  stream_.seekp(0, std::ios_base::end);
  should_log_ = sb.should_log_;
  log_severity_ = sb.log_severity_;
  return *this;
}

StatusBuilder& StatusBuilder::Log(absl::LogSeverity level) {
  if (status_.ok()) return *this;
  should_log_ = true;
  log_severity_ = level;
  return *this;
}

StatusBuilder& StatusBuilder::SetErrorCode(absl::StatusCode code) {
  if (status_.ok()) return *this;
  status_ = absl::Status(code, status_.message());
  return *this;
}

StatusBuilder::operator absl::Status() const& {
  return CreateStatusAndConditionallyLog();
}

StatusBuilder::operator absl::Status() && {
  if (stream_.tellp() == 0 && !should_log_) return std::move(status_);
  return CreateStatusAndConditionallyLog();
}

absl::Status StatusBuilder::JoinMessageToStatus(absl::Status s,
                                                absl::string_view msg) {
  if (msg.empty()) return s;
  if (s.message().empty()) return absl::Status(s.code(), msg);
  return absl::Status(s.code(), absl::StrCat(s.message(), "; ", msg));
}

absl::Status StatusBuilder::CreateStatusAndConditionallyLog() const {
  absl::Status result = JoinMessageToStatus(status_, stream_.str());
  if (should_log_ && !result.ok()) {
    switch (log_severity_) {
      case absl::LogSeverity::kInfo:
        STRUCTDIFF_LOG(INFO) << result;
        break;
      case absl::LogSeverity::kWarning:
        STRUCTDIFF_LOG(WARNING) << result;
        break;
      case absl::LogSeverity::kError:
        STRUCTDIFF_LOG(ERROR) << result;
        break;
      case absl::LogSeverity::kFatal:
        STRUCTDIFF_LOG(FATAL) << result;
        break;
    }
  }
  return result;
}

StatusBuilder FailedPreconditionErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kFailedPrecondition);
}

StatusBuilder InternalErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInternal);
}

StatusBuilder InvalidArgumentErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInvalidArgument);
}

StatusBuilder OutOfRangeErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kOutOfRange);
}

StatusBuilder ResourceExhaustedErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kResourceExhausted);
}

StatusBuilder UnimplementedErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kUnimplemented);
}

}  // namespace structdiff_base
