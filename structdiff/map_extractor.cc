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


#include "structdiff/map_extractor.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/ret_check.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"

namespace structdiff {
namespace {

// Walks the union of both key sets in key order.
class MapPatchIterator : public PatchIterator {
 public:
  MapPatchIterator(Value first, Value second, Path node,
                   absl::string_view dotted_node, const IgnoreSet* ignore)
      : first_(std::move(first)),
        second_(std::move(second)),
        node_(std::move(node)),
        dotted_node_(dotted_node),
        ignore_(ignore),
        first_it_(first_.map().begin()),
        second_it_(second_.map().begin()) {}

  bool Next(MetaPatch* patch) override {
    const Value::Map& first = first_.map();
    const Value::Map& second = second_.map();
    while (first_it_ != first.end() || second_it_ != second.end()) {
      if (second_it_ == second.end() ||
          (first_it_ != first.end() && first_it_->first < second_it_->first)) {
        const auto entry = first_it_++;
        if (IsIgnored(entry->first)) continue;
        *patch = MetaPatch::Delete(entry->first, entry->first, entry->second);
        return true;
      }
      if (first_it_ == first.end() || second_it_->first < first_it_->first) {
        const auto entry = second_it_++;
        if (IsIgnored(entry->first)) continue;
        *patch = MetaPatch::Insert(entry->first, entry->first, entry->second);
        return true;
      }
      const auto old_entry = first_it_++;
      const auto new_entry = second_it_++;
      if (IsIgnored(old_entry->first)) continue;
      *patch = MetaPatch::Change(old_entry->first, old_entry->first,
                                 old_entry->second, new_entry->second);
      return true;
    }
    return false;
  }

 private:
  bool IsIgnored(const Value& key) const {
    return ignore_ != nullptr && ignore_->Contains(node_, dotted_node_, key);
  }

  // Keep the payloads alive for the iterators below.
  const Value first_;
  const Value second_;
  const Path node_;
  const std::string dotted_node_;
  const IgnoreSet* const ignore_;
  Value::Map::const_iterator first_it_;
  Value::Map::const_iterator second_it_;
};

absl::Status CheckKeysHashable(const Value& map) {
  for (const auto& entry : map.map()) {
    if (!entry.first.IsHashable()) {
      return structdiff_base::InvalidArgumentErrorBuilder()
             << "unhashable map key " << entry.first.DebugString();
    }
  }
  return absl::OkStatus();
}

}  // namespace

bool MapExtractor::IsApplicable(const Value& first,
                                const Value& second) const {
  return first.kind() == Value::kMap && second.kind() == Value::kMap;
}

absl::StatusOr<std::unique_ptr<PatchIterator>> MapExtractor::Extract(
    const Value& first, const Value& second, const Path& node,
    absl::string_view dotted_node, const IgnoreSet* ignore) const {
  STRUCTDIFF_RET_CHECK(IsApplicable(first, second))
      << "map extractor called on " << KindName(first.kind()) << " and "
      << KindName(second.kind());
  STRUCTDIFF_RETURN_IF_ERROR(CheckKeysHashable(first));
  STRUCTDIFF_RETURN_IF_ERROR(CheckKeysHashable(second));
  return absl::make_unique<MapPatchIterator>(first, second, node, dotted_node,
                                             ignore);
}

}  // namespace structdiff
