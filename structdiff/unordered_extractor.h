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


#ifndef STRUCTDIFF_UNORDERED_EXTRACTOR_H_
#define STRUCTDIFF_UNORDERED_EXTRACTOR_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

namespace structdiff {

// Diffs two sets. Yields at most one insert carrying the set of added
// elements and one delete carrying the set of removed elements, both without
// positions. Unhashable elements are an InvalidArgument error.
class UnorderedExtractor : public Extractor {
 public:
  ExtractorKind kind() const override { return ExtractorKind::kUnordered; }

  bool IsApplicable(const Value& first, const Value& second) const override;

  absl::StatusOr<std::unique_ptr<PatchIterator>> Extract(
      const Value& first, const Value& second, const Path& node,
      absl::string_view dotted_node, const IgnoreSet* ignore) const override;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_UNORDERED_EXTRACTOR_H_
