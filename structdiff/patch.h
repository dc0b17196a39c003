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


// Edit descriptors produced while diffing two values.
//
// A MetaPatch describes one edit inside a single container, with positions
// relative to that container. A Patch is the fully qualified form produced by
// the diff driver, with paths from the root.
#ifndef STRUCTDIFF_PATCH_H_
#define STRUCTDIFF_PATCH_H_

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "structdiff/node_path.h"
#include "structdiff/value.h"

namespace structdiff {

enum class PatchAction {
  kInsert,
  kDelete,
  kChange,
};

// "insert", "delete" or "change".
const char* PatchActionName(PatchAction action);

// One-level edit. Invariant: inserts carry no old_value, deletes carry no
// new_value, changes carry both. Positions are absent for aggregate set
// edits.
struct MetaPatch {
  static MetaPatch Insert(absl::optional<Value> old_position,
                          absl::optional<Value> new_position, Value value);
  static MetaPatch Delete(absl::optional<Value> old_position,
                          absl::optional<Value> new_position, Value value);
  static MetaPatch Change(Value old_position, Value new_position,
                          Value old_value, Value new_value);

  std::string DebugString() const;

  PatchAction action = PatchAction::kChange;
  absl::optional<Value> old_position;
  absl::optional<Value> new_position;
  absl::optional<Value> old_value;
  absl::optional<Value> new_value;
};

bool operator==(const MetaPatch& a, const MetaPatch& b);
inline bool operator!=(const MetaPatch& a, const MetaPatch& b) {
  return !(a == b);
}
std::ostream& operator<<(std::ostream& os, const MetaPatch& patch);

// Lazily produces the meta-patches of one extraction. Consumers may stop
// early.
//
//   MetaPatch patch;
//   while (it->Next(&patch)) { ... }
class PatchIterator {
 public:
  virtual ~PatchIterator() = default;

  // Stores the next patch in *patch and returns true, or returns false once
  // the sequence is exhausted.
  virtual bool Next(MetaPatch* patch) = 0;
};

// Yields patches computed ahead of time.
class VectorPatchIterator : public PatchIterator {
 public:
  explicit VectorPatchIterator(std::vector<MetaPatch> patches)
      : patches_(std::move(patches)) {}

  bool Next(MetaPatch* patch) override;

 private:
  std::vector<MetaPatch> patches_;
  size_t next_ = 0;
};

// Drains the iterator.
std::vector<MetaPatch> CollectPatches(PatchIterator* iterator);

// Convenience for callers that want all patches of a fallible extraction.
absl::StatusOr<std::vector<MetaPatch>> CollectPatches(
    absl::StatusOr<std::unique_ptr<PatchIterator>> iterator);

// Fully qualified edit. For insert and delete, old_path and new_path end in
// the affected key or index; for aggregate set edits they name the set.
struct Patch {
  std::string DebugString() const;

  PatchAction action = PatchAction::kChange;
  Path old_path;
  Path new_path;
  absl::optional<Value> old_value;
  absl::optional<Value> new_value;
};

bool operator==(const Patch& a, const Patch& b);
inline bool operator!=(const Patch& a, const Patch& b) { return !(a == b); }
std::ostream& operator<<(std::ostream& os, const Patch& patch);

}  // namespace structdiff

#endif  // STRUCTDIFF_PATCH_H_
