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


#include "structdiff/extractor.h"

#include "structdiff/alignment_extractor.h"
#include "structdiff/base/logging.h"
#include "structdiff/map_extractor.h"
#include "structdiff/positional_extractor.h"
#include "structdiff/unordered_extractor.h"

namespace structdiff {

const char* ExtractorKindName(ExtractorKind kind) {
  switch (kind) {
    case ExtractorKind::kMap:
      return "map";
    case ExtractorKind::kPositional:
      return "positional";
    case ExtractorKind::kUnordered:
      return "unordered";
    case ExtractorKind::kAlignment:
      return "alignment";
  }
  return "unknown";
}

const Extractor& GetExtractor(ExtractorKind kind) {
  // Function-local statics are never destroyed.
  static const auto* const map = new MapExtractor();
  static const auto* const positional = new PositionalExtractor();
  static const auto* const unordered = new UnorderedExtractor();
  static const auto* const alignment = new AlignmentExtractor();
  switch (kind) {
    case ExtractorKind::kMap:
      return *map;
    case ExtractorKind::kPositional:
      return *positional;
    case ExtractorKind::kUnordered:
      return *unordered;
    case ExtractorKind::kAlignment:
      return *alignment;
  }
  STRUCTDIFF_LOG(FATAL) << "Unknown extractor kind "
                        << static_cast<int>(kind);
  return *map;
}

}  // namespace structdiff
