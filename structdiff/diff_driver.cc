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


#include "structdiff/diff_driver.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "structdiff/base/logging.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"

namespace structdiff {
namespace {

// State of one Drive() call.
class Walker {
 public:
  Walker(const ExtractorTable& table, const DriveOptions& options,
         std::vector<Patch>* patches)
      : table_(table), options_(options), patches_(patches) {}

  absl::Status Walk(const Value& first, const Value& second,
                    const Path& old_node, const Path& new_node);

 private:
  const Extractor* Select(const Value& first, const Value& second) const;

  void AddLeafChange(const Value& first, const Value& second,
                     const Path& old_node, const Path& new_node);

  // Adds an insert or delete. Aggregate edits without positions apply to the
  // node itself.
  void AddEdit(const MetaPatch& patch, const Path& old_node,
               const Path& new_node);

  const ExtractorTable& table_;
  const DriveOptions& options_;
  std::vector<Patch>* patches_;
};

const Extractor* Walker::Select(const Value& first,
                                const Value& second) const {
  const Extractor* exact = table_.FindExact(first.kind());
  if (exact != nullptr && exact->IsApplicable(first, second)) return exact;
  if (!options_.try_default) return nullptr;
  for (const Extractor* extractor : table_.fallback()) {
    if (extractor->IsApplicable(first, second)) return extractor;
  }
  return nullptr;
}

void Walker::AddLeafChange(const Value& first, const Value& second,
                           const Path& old_node, const Path& new_node) {
  if (first == second) return;
  Patch patch;
  patch.action = PatchAction::kChange;
  patch.old_path = old_node;
  patch.new_path = new_node;
  patch.old_value = first;
  patch.new_value = second;
  patches_->push_back(std::move(patch));
}

void Walker::AddEdit(const MetaPatch& meta, const Path& old_node,
                     const Path& new_node) {
  const bool aggregate = !meta.old_position.has_value();
  Patch patch;
  patch.action = meta.action;
  patch.old_path = aggregate ? old_node : ChildPath(old_node,
                                                    *meta.old_position);
  patch.new_path = meta.new_position.has_value()
                       ? ChildPath(new_node, *meta.new_position)
                       : new_node;
  const absl::optional<Value>& payload =
      meta.action == PatchAction::kInsert ? meta.new_value : meta.old_value;
  if (!options_.expand || !aggregate || !payload.has_value() ||
      payload->kind() != Value::kSet) {
    patch.old_value = meta.old_value;
    patch.new_value = meta.new_value;
    patches_->push_back(std::move(patch));
    return;
  }
  for (const Value& element : payload->set()) {
    Patch single = patch;
    const Value value = Value::FromSet({element});
    if (meta.action == PatchAction::kInsert) {
      single.new_value = value;
    } else {
      single.old_value = value;
    }
    patches_->push_back(std::move(single));
  }
}

absl::Status Walker::Walk(const Value& first, const Value& second,
                          const Path& old_node, const Path& new_node) {
  if (options_.path_limit != nullptr &&
      options_.path_limit->IsLimit(old_node)) {
    STRUCTDIFF_VLOG(2) << "Path limit at " << PathDebugString(old_node);
    AddLeafChange(first, second, old_node, new_node);
    return absl::OkStatus();
  }

  const Extractor* extractor = Select(first, second);
  if (extractor == nullptr) {
    if (!options_.try_default && first.kind() == second.kind() &&
        first.is_container()) {
      return structdiff_base::FailedPreconditionErrorBuilder()
             << "no applicable extractor for " << KindName(first.kind())
             << " values at " << PathDebugString(old_node);
    }
    AddLeafChange(first, second, old_node, new_node);
    return absl::OkStatus();
  }
  STRUCTDIFF_VLOG(1) << "Using " << ExtractorKindName(extractor->kind())
                     << " extractor at " << PathDebugString(old_node);

  const std::string dotted_node = DottedPath(old_node);
  STRUCTDIFF_ASSIGN_OR_RETURN(
      std::unique_ptr<PatchIterator> it,
      extractor->Extract(first, second, old_node, dotted_node,
                         options_.ignore));
  MetaPatch meta;
  while (it->Next(&meta)) {
    STRUCTDIFF_VLOG(2) << "At " << PathDebugString(old_node) << ": "
                       << meta.DebugString();
    if (meta.action != PatchAction::kChange) {
      AddEdit(meta, old_node, new_node);
      continue;
    }
    if (*meta.old_value == *meta.new_value) continue;
    STRUCTDIFF_RETURN_IF_ERROR(
        Walk(*meta.old_value, *meta.new_value,
             ChildPath(old_node, *meta.old_position),
             ChildPath(new_node, *meta.new_position)));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::vector<Patch>> RecursiveDiffDriver::Drive(
    const Value& first, const Value& second, const ExtractorTable& table,
    const DriveOptions& options) const {
  std::vector<Patch> patches;
  Walker walker(table, options, &patches);
  STRUCTDIFF_RETURN_IF_ERROR(walker.Walk(first, second, Path(), Path()));
  return patches;
}

const DiffDriver& DefaultDiffDriver() {
  static const auto* const driver = new RecursiveDiffDriver();
  return *driver;
}

}  // namespace structdiff
