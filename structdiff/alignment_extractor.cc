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


#include "structdiff/alignment_extractor.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/lcs.h"
#include "structdiff/base/logging.h"
#include "structdiff/base/ret_check.h"
#include "structdiff/base/status_macros.h"
#include "structdiff/canonical_value.h"

ABSL_FLAG(int32_t, structdiff_lcs_max_memory, 0,
          "If positive, aligning two lists fails when it needs more than "
          "this many bytes. Otherwise lists of any length are aligned, in "
          "linear memory where needed.");

namespace structdiff {
namespace {

absl::StatusOr<std::vector<CanonicalValue>> CanonicalizeAll(
    const Value::List& items) {
  std::vector<CanonicalValue> canonical;
  canonical.reserve(items.size());
  for (const Value& item : items) {
    STRUCTDIFF_ASSIGN_OR_RETURN(CanonicalValue value,
                                CanonicalValue::Canonicalize(item));
    canonical.push_back(std::move(value));
  }
  return canonical;
}

// Translates one opcode at a time.
class AlignmentPatchIterator : public PatchIterator {
 public:
  AlignmentPatchIterator(Value first, Value second,
                         std::vector<Opcode> opcodes)
      : first_(std::move(first)),
        second_(std::move(second)),
        opcodes_(std::move(opcodes)) {}

  bool Next(MetaPatch* patch) override {
    while (pending_next_ >= pending_.size()) {
      if (next_opcode_ >= opcodes_.size()) return false;
      pending_.clear();
      pending_next_ = 0;
      shift_ = TranslateOpcode(opcodes_[next_opcode_++], shift_,
                               first_.list(), second_.list(), &pending_);
    }
    *patch = std::move(pending_[pending_next_++]);
    return true;
  }

 private:
  const Value first_;
  const Value second_;
  const std::vector<Opcode> opcodes_;
  size_t next_opcode_ = 0;
  IndexShift shift_;
  std::vector<MetaPatch> pending_;
  size_t pending_next_ = 0;
};

}  // namespace

IndexShift TranslateOpcode(const Opcode& opcode, IndexShift shift,
                           const Value::List& first, const Value::List& second,
                           std::vector<MetaPatch>* patches) {
  switch (opcode.type) {
    case UNCHANGED:
      return shift;
    case ADDED: {
      for (int k = 0; k < opcode.target_length(); ++k) {
        const int new_index = opcode.target_first + k;
        patches->push_back(
            MetaPatch::Insert(Value::Int(shift.Remap(opcode.source_first + k)),
                              Value::Int(new_index), second[new_index]));
      }
      return shift.WithInsertions(opcode.target_length());
    }
    case REMOVED: {
      for (int index = opcode.source_last - 1; index >= opcode.source_first;
           --index) {
        const Value position = Value::Int(shift.Remap(index));
        patches->push_back(
            MetaPatch::Delete(position, position, first[index]));
      }
      return shift.WithDeletions(opcode.source_length());
    }
    case CHANGED: {
      const int changes =
          std::min(opcode.source_length(), opcode.target_length());
      int64_t last_position = 0;
      for (int k = 0; k < changes; ++k) {
        const int old_index = opcode.source_first + k;
        const int new_index = opcode.target_first + k;
        last_position = shift.Remap(old_index);
        patches->push_back(MetaPatch::Change(
            Value::Int(last_position), Value::Int(new_index), first[old_index],
            second[new_index]));
      }
      // Surplus new elements follow the last changed one.
      for (int new_index = opcode.target_first + changes;
           new_index < opcode.target_last; ++new_index) {
        ++last_position;
        patches->push_back(MetaPatch::Insert(Value::Int(last_position),
                                             Value::Int(new_index),
                                             second[new_index]));
        shift = shift.WithInsertions(1);
      }
      // Surplus old elements are removed from the back.
      for (int old_index = opcode.source_last - 1;
           old_index >= opcode.source_first + changes; --old_index) {
        const Value position = Value::Int(shift.Remap(old_index));
        patches->push_back(
            MetaPatch::Delete(position, position, first[old_index]));
      }
      return shift.WithDeletions(
          std::max(0, opcode.source_length() - changes));
    }
  }
  STRUCTDIFF_LOG(FATAL) << "Invalid opcode " << opcode;
  return shift;
}

bool AlignmentExtractor::IsApplicable(const Value& first,
                                      const Value& second) const {
  return first.kind() == Value::kList && second.kind() == Value::kList;
}

absl::StatusOr<std::unique_ptr<PatchIterator>> AlignmentExtractor::Extract(
    const Value& first, const Value& second, const Path& node,
    absl::string_view dotted_node, const IgnoreSet* ignore) const {
  STRUCTDIFF_RET_CHECK(IsApplicable(first, second))
      << "alignment extractor called on " << KindName(first.kind())
      << " and " << KindName(second.kind());
  STRUCTDIFF_ASSIGN_OR_RETURN(std::vector<CanonicalValue> left,
                              CanonicalizeAll(first.list()));
  STRUCTDIFF_ASSIGN_OR_RETURN(std::vector<CanonicalValue> right,
                              CanonicalizeAll(second.list()));

  std::vector<int> left_int;
  std::vector<int> right_int;
  const int keys = structdiff_base::Lcs::MapToInteger<CanonicalValue>(
      left, right, &left_int, &right_int);

  structdiff_base::LcsOptions options;
  const int32_t max_memory = absl::GetFlag(FLAGS_structdiff_lcs_max_memory);
  if (max_memory > 0) {
    options.set_max_memory(max_memory);
  } else {
    options.set_strict_memory_limit(false);
  }
  STRUCTDIFF_ASSIGN_OR_RETURN(std::vector<Opcode> opcodes,
                              ComputeOpcodes(left_int, right_int, options),
                              _ << "at " << PathDebugString(node));
  STRUCTDIFF_VLOG(2) << "Aligned " << left.size() << " and " << right.size()
                     << " elements over " << keys << " keys into "
                     << opcodes.size() << " opcodes at " << dotted_node;
  return absl::make_unique<AlignmentPatchIterator>(first, second,
                                                   std::move(opcodes));
}

}  // namespace structdiff
