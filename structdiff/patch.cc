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


#include "structdiff/patch.h"

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "structdiff/base/status_macros.h"

namespace structdiff {

namespace {

std::string OptionalDebugString(const absl::optional<Value>& value) {
  return value.has_value() ? value->DebugString() : "-";
}

}  // namespace

const char* PatchActionName(PatchAction action) {
  switch (action) {
    case PatchAction::kInsert:
      return "insert";
    case PatchAction::kDelete:
      return "delete";
    case PatchAction::kChange:
      return "change";
  }
  return "unknown";
}

MetaPatch MetaPatch::Insert(absl::optional<Value> old_position,
                            absl::optional<Value> new_position, Value value) {
  MetaPatch patch;
  patch.action = PatchAction::kInsert;
  patch.old_position = std::move(old_position);
  patch.new_position = std::move(new_position);
  patch.new_value = std::move(value);
  return patch;
}

MetaPatch MetaPatch::Delete(absl::optional<Value> old_position,
                            absl::optional<Value> new_position, Value value) {
  MetaPatch patch;
  patch.action = PatchAction::kDelete;
  patch.old_position = std::move(old_position);
  patch.new_position = std::move(new_position);
  patch.old_value = std::move(value);
  return patch;
}

MetaPatch MetaPatch::Change(Value old_position, Value new_position,
                            Value old_value, Value new_value) {
  MetaPatch patch;
  patch.action = PatchAction::kChange;
  patch.old_position = std::move(old_position);
  patch.new_position = std::move(new_position);
  patch.old_value = std::move(old_value);
  patch.new_value = std::move(new_value);
  return patch;
}

std::string MetaPatch::DebugString() const {
  return absl::StrCat(PatchActionName(action), " ",
                      OptionalDebugString(old_position), "->",
                      OptionalDebugString(new_position), " ",
                      OptionalDebugString(old_value), "->",
                      OptionalDebugString(new_value));
}

bool operator==(const MetaPatch& a, const MetaPatch& b) {
  return a.action == b.action && a.old_position == b.old_position &&
         a.new_position == b.new_position && a.old_value == b.old_value &&
         a.new_value == b.new_value;
}

std::ostream& operator<<(std::ostream& os, const MetaPatch& patch) {
  return os << patch.DebugString();
}

bool VectorPatchIterator::Next(MetaPatch* patch) {
  if (next_ >= patches_.size()) return false;
  *patch = std::move(patches_[next_++]);
  return true;
}

std::vector<MetaPatch> CollectPatches(PatchIterator* iterator) {
  std::vector<MetaPatch> patches;
  MetaPatch patch;
  while (iterator->Next(&patch)) {
    patches.push_back(std::move(patch));
    patch = MetaPatch();
  }
  return patches;
}

absl::StatusOr<std::vector<MetaPatch>> CollectPatches(
    absl::StatusOr<std::unique_ptr<PatchIterator>> iterator) {
  STRUCTDIFF_ASSIGN_OR_RETURN(std::unique_ptr<PatchIterator> it,
                              std::move(iterator));
  return CollectPatches(it.get());
}

std::string Patch::DebugString() const {
  std::string path = PathDebugString(old_path);
  if (new_path != old_path) {
    absl::StrAppend(&path, "->", PathDebugString(new_path));
  }
  return absl::StrCat(PatchActionName(action), " ", path, " ",
                      OptionalDebugString(old_value), "->",
                      OptionalDebugString(new_value));
}

bool operator==(const Patch& a, const Patch& b) {
  return a.action == b.action && a.old_path == b.old_path &&
         a.new_path == b.new_path && a.old_value == b.old_value &&
         a.new_value == b.new_value;
}

std::ostream& operator<<(std::ostream& os, const Patch& patch) {
  return os << patch.DebugString();
}

}  // namespace structdiff
