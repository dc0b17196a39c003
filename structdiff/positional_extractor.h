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


#ifndef STRUCTDIFF_POSITIONAL_EXTRACTOR_H_
#define STRUCTDIFF_POSITIONAL_EXTRACTOR_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

namespace structdiff {

// Diffs two lists index by index, without detecting moved elements.
//
//   [1, 2, 3] vs [1, 9]  ->  change@0, change@1, delete@2
//
// Indices present in both lists yield a change. Surplus elements of the second
// list are inserts in ascending order; surplus elements of the first list are
// deletes in descending order, so that every position stays valid when the
// patches are applied one after another.
class PositionalExtractor : public Extractor {
 public:
  ExtractorKind kind() const override { return ExtractorKind::kPositional; }

  bool IsApplicable(const Value& first, const Value& second) const override;

  absl::StatusOr<std::unique_ptr<PatchIterator>> Extract(
      const Value& first, const Value& second, const Path& node,
      absl::string_view dotted_node, const IgnoreSet* ignore) const override;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_POSITIONAL_EXTRACTOR_H_
