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


#include "structdiff/positional_extractor.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/ret_check.h"

namespace structdiff {
namespace {

class PositionalPatchIterator : public PatchIterator {
 public:
  PositionalPatchIterator(Value first, Value second)
      : first_(std::move(first)),
        second_(std::move(second)),
        common_(std::min(first_.list().size(), second_.list().size())) {
    // Surplus elements of the first list are deleted from the back.
    next_delete_ = static_cast<int64_t>(first_.list().size()) - 1;
  }

  bool Next(MetaPatch* patch) override {
    const Value::List& first = first_.list();
    const Value::List& second = second_.list();
    if (next_ < common_) {
      const Value position = Value::Int(next_);
      *patch = MetaPatch::Change(position, position, first[next_],
                                 second[next_]);
      ++next_;
      return true;
    }
    if (next_ < second.size()) {
      const Value position = Value::Int(next_);
      *patch = MetaPatch::Insert(position, position, second[next_]);
      ++next_;
      return true;
    }
    if (next_delete_ >= static_cast<int64_t>(common_)) {
      const Value position = Value::Int(next_delete_);
      *patch = MetaPatch::Delete(position, position, first[next_delete_]);
      --next_delete_;
      return true;
    }
    return false;
  }

 private:
  const Value first_;
  const Value second_;
  const size_t common_;
  size_t next_ = 0;
  int64_t next_delete_;
};

}  // namespace

bool PositionalExtractor::IsApplicable(const Value& first,
                                       const Value& second) const {
  return first.kind() == Value::kList && second.kind() == Value::kList;
}

absl::StatusOr<std::unique_ptr<PatchIterator>> PositionalExtractor::Extract(
    const Value& first, const Value& second, const Path& node,
    absl::string_view dotted_node, const IgnoreSet* ignore) const {
  STRUCTDIFF_RET_CHECK(IsApplicable(first, second))
      << "positional extractor called on " << KindName(first.kind())
      << " and " << KindName(second.kind());
  return absl::make_unique<PositionalPatchIterator>(first, second);
}

}  // namespace structdiff
