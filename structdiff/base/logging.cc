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

#include "structdiff/base/logging.h"

#include <cstdint>

#include "absl/flags/flag.h"

ABSL_FLAG(int32_t, structdiff_v, 0,
          "Show all STRUCTDIFF_VLOG(m) messages for m <= this value.");

namespace structdiff_base {

bool VLogIsOn(int level) {
  return level <= absl::GetFlag(FLAGS_structdiff_v);
}

}  // namespace structdiff_base
