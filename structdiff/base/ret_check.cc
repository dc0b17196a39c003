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

#include "structdiff/base/ret_check.h"

#include "structdiff/base/status_builder.h"

namespace structdiff_base {
namespace internal_ret_check {

StatusBuilder RetCheckFailSlowPath(const char* file, int line) {
  StatusBuilder builder = InternalErrorBuilder();
  builder.LogError() << "STRUCTDIFF_RET_CHECK failure (" << file << ":" << line
                     << ") ";
  return builder;
}

StatusBuilder RetCheckFailSlowPath(const char* file, int line,
                                   const char* condition) {
  StatusBuilder builder = RetCheckFailSlowPath(file, line);
  builder << condition << " ";
  return builder;
}

}  // namespace internal_ret_check
}  // namespace structdiff_base
