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

// Logging and assertion macros for structdiff, backed by absl/log.
//
//   STRUCTDIFF_LOG(INFO) << "Diffing " << path;
//   STRUCTDIFF_VLOG(2) << "Only printed with --structdiff_v=2 or higher";
//   STRUCTDIFF_CHECK_EQ(a.size(), b.size()) << "Aborts the process";
//   STRUCTDIFF_DCHECK(ptr != nullptr);  // Only evaluated in debug builds.
#ifndef STRUCTDIFF_BASE_LOGGING_H_
#define STRUCTDIFF_BASE_LOGGING_H_

#include <cstdint>

#include "absl/flags/declare.h"
#include "absl/log/check.h"
#include "absl/log/log.h"

ABSL_DECLARE_FLAG(int32_t, structdiff_v);

namespace structdiff_base {

// Returns true if messages at the given verbosity level should be logged.
bool VLogIsOn(int level);

}  // namespace structdiff_base

#define STRUCTDIFF_LOG(severity) LOG(severity)
#define STRUCTDIFF_LOG_IF(severity, condition) LOG_IF(severity, condition)

#define STRUCTDIFF_VLOG(level) \
  LOG_IF(INFO, ::structdiff_base::VLogIsOn(level))

#define STRUCTDIFF_CHECK(condition) CHECK(condition)
#define STRUCTDIFF_CHECK_EQ(a, b) CHECK_EQ(a, b)
#define STRUCTDIFF_CHECK_NE(a, b) CHECK_NE(a, b)
#define STRUCTDIFF_CHECK_LE(a, b) CHECK_LE(a, b)
#define STRUCTDIFF_CHECK_LT(a, b) CHECK_LT(a, b)
#define STRUCTDIFF_CHECK_GE(a, b) CHECK_GE(a, b)
#define STRUCTDIFF_CHECK_GT(a, b) CHECK_GT(a, b)

#define STRUCTDIFF_DCHECK(condition) DCHECK(condition)
#define STRUCTDIFF_DCHECK_EQ(a, b) DCHECK_EQ(a, b)
#define STRUCTDIFF_DCHECK_LE(a, b) DCHECK_LE(a, b)

#endif  // STRUCTDIFF_BASE_LOGGING_H_
