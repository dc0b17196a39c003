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


#ifndef STRUCTDIFF_ALIGNMENT_EXTRACTOR_H_
#define STRUCTDIFF_ALIGNMENT_EXTRACTOR_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/flags/declare.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/opcode.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

ABSL_DECLARE_FLAG(int32_t, structdiff_lcs_max_memory);

namespace structdiff {

// Net number of elements inserted into and deleted from a list by the patches
// emitted so far. An index of the original list maps to the current list by
// Remap().
class IndexShift {
 public:
  IndexShift() = default;
  IndexShift(int64_t inserted, int64_t deleted)
      : inserted_(inserted), deleted_(deleted) {}

  int64_t inserted() const { return inserted_; }
  int64_t deleted() const { return deleted_; }

  int64_t Remap(int64_t index) const { return index + inserted_ - deleted_; }

  IndexShift WithInsertions(int64_t n) const {
    return IndexShift(inserted_ + n, deleted_);
  }
  IndexShift WithDeletions(int64_t n) const {
    return IndexShift(inserted_, deleted_ + n);
  }

  friend bool operator==(const IndexShift& a, const IndexShift& b) {
    return a.inserted_ == b.inserted_ && a.deleted_ == b.deleted_;
  }

 private:
  int64_t inserted_ = 0;
  int64_t deleted_ = 0;
};

// Appends the patches for one opcode over first and second to *patches and
// returns the shift after them. Positions are valid against the list as it
// stands once all earlier patches have been applied:
//
//   equal:   nothing.
//   insert:  each new element at Remap(source_first + k).
//   delete:  each old element, last one first, at its remapped index.
//   replace: pairwise changes, then the surplus new elements inserted after
//            the last change, or the surplus old elements deleted from the
//            back.
//
// For changes and inserts, new_position is the index in second.
IndexShift TranslateOpcode(const Opcode& opcode, IndexShift shift,
                           const Value::List& first, const Value::List& second,
                           std::vector<MetaPatch>* patches);

// Diffs two lists by aligning them on their longest common subsequence, so
// that inserted, removed and replaced runs are reported as such instead of
// as a cascade of index-by-index changes.
//
//   [1, 2, 3, 4] vs [1, 3, 4, 5]  ->  delete@1 (2), insert@3 (5)
//
// Elements are compared through CanonicalValue, so nested lists and sets
// match structurally and maps match as wholes. Applying the patches in order
// to first yields second. Fails with ResourceExhausted only if a positive
// --structdiff_lcs_max_memory is set and the alignment does not fit into it.
class AlignmentExtractor : public Extractor {
 public:
  ExtractorKind kind() const override { return ExtractorKind::kAlignment; }

  bool IsApplicable(const Value& first, const Value& second) const override;

  absl::StatusOr<std::unique_ptr<PatchIterator>> Extract(
      const Value& first, const Value& second, const Path& node,
      absl::string_view dotted_node, const IgnoreSet* ignore) const override;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_ALIGNMENT_EXTRACTOR_H_
