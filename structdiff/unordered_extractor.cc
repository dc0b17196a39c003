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


#include "structdiff/unordered_extractor.h"

#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/ret_check.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"

namespace structdiff {
namespace {

absl::Status CheckElementsHashable(const Value& set) {
  for (const Value& element : set.set()) {
    if (!element.IsHashable()) {
      return structdiff_base::InvalidArgumentErrorBuilder()
             << "unhashable set element " << element.DebugString();
    }
  }
  return absl::OkStatus();
}

// Returns the elements of a that are not in b.
Value::Set Difference(const Value::Set& a, const Value::Set& b) {
  Value::Set result;
  std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                      std::inserter(result, result.end()));
  return result;
}

}  // namespace

bool UnorderedExtractor::IsApplicable(const Value& first,
                                      const Value& second) const {
  return first.kind() == Value::kSet && second.kind() == Value::kSet;
}

absl::StatusOr<std::unique_ptr<PatchIterator>> UnorderedExtractor::Extract(
    const Value& first, const Value& second, const Path& node,
    absl::string_view dotted_node, const IgnoreSet* ignore) const {
  STRUCTDIFF_RET_CHECK(IsApplicable(first, second))
      << "unordered extractor called on " << KindName(first.kind()) << " and "
      << KindName(second.kind());
  STRUCTDIFF_RETURN_IF_ERROR(CheckElementsHashable(first));
  STRUCTDIFF_RETURN_IF_ERROR(CheckElementsHashable(second));

  std::vector<MetaPatch> patches;
  Value::Set addition = Difference(second.set(), first.set());
  if (!addition.empty()) {
    patches.push_back(MetaPatch::Insert(absl::nullopt, absl::nullopt,
                                        Value::FromSet(std::move(addition))));
  }
  Value::Set deletion = Difference(first.set(), second.set());
  if (!deletion.empty()) {
    patches.push_back(MetaPatch::Delete(absl::nullopt, absl::nullopt,
                                        Value::FromSet(std::move(deletion))));
  }
  return absl::make_unique<VectorPatchIterator>(std::move(patches));
}

}  // namespace structdiff
