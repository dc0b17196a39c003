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


#ifndef STRUCTDIFF_EXTRACTOR_H_
#define STRUCTDIFF_EXTRACTOR_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

namespace structdiff {

// The available one-level diff algorithms.
enum class ExtractorKind {
  // Maps, by key.
  kMap,
  // Lists, index by index.
  kPositional,
  // Sets, by set difference.
  kUnordered,
  // Lists, aligned by their longest common subsequence.
  kAlignment,
};

const char* ExtractorKindName(ExtractorKind kind);

// Computes the edits between two values of one container shape, one level
// deep. Extractors never look inside the values they report; deciding
// whether to descend is left to the caller.
//
// Implementations are stateless and thread-safe.
class Extractor {
 public:
  virtual ~Extractor() = default;

  virtual ExtractorKind kind() const = 0;

  // Returns true if Extract() can handle this pair of values.
  virtual bool IsApplicable(const Value& first, const Value& second) const = 0;

  // Returns the edits turning first into second. node is the path of both
  // values from the root and dotted_node its DottedPath(); both are only used
  // to match keys against ignore, which may be nullptr and must outlive the
  // returned iterator.
  //
  // Calling Extract() on a pair for which IsApplicable() is false is an
  // internal error.
  virtual absl::StatusOr<std::unique_ptr<PatchIterator>> Extract(
      const Value& first, const Value& second, const Path& node,
      absl::string_view dotted_node, const IgnoreSet* ignore) const = 0;
};

// Returns the shared instance implementing kind.
const Extractor& GetExtractor(ExtractorKind kind);

}  // namespace structdiff

#endif  // STRUCTDIFF_EXTRACTOR_H_
