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


#ifndef STRUCTDIFF_MAP_EXTRACTOR_H_
#define STRUCTDIFF_MAP_EXTRACTOR_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

namespace structdiff {

// Diffs two maps by key. Keys present in both maps yield a change (even if
// the values are equal), keys only in the first map a delete and keys only in
// the second map an insert, in key order. Both positions carry the key.
// Ignored keys yield nothing. Unhashable keys are an InvalidArgument error.
class MapExtractor : public Extractor {
 public:
  ExtractorKind kind() const override { return ExtractorKind::kMap; }

  bool IsApplicable(const Value& first, const Value& second) const override;

  absl::StatusOr<std::unique_ptr<PatchIterator>> Extract(
      const Value& first, const Value& second, const Path& node,
      absl::string_view dotted_node, const IgnoreSet* ignore) const override;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_MAP_EXTRACTOR_H_
