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


// The recursive walk that turns one-level extractions into a complete,
// fully qualified diff of two nested values.
#ifndef STRUCTDIFF_DIFF_DRIVER_H_
#define STRUCTDIFF_DIFF_DRIVER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

namespace structdiff {

// Tells the driver which extractor handles which pair of values.
class ExtractorTable {
 public:
  virtual ~ExtractorTable() = default;

  // Returns the extractor registered for values of this kind, or nullptr.
  virtual const Extractor* FindExact(Value::Kind kind) const = 0;

  // Extractors tried in order when the exact entry is missing or not
  // applicable.
  virtual const std::vector<const Extractor*>& fallback() const = 0;
};

struct DriveOptions {
  // Keys excluded from comparison. May be nullptr.
  const IgnoreSet* ignore = nullptr;
  // Whether the fallback extractors are consulted.
  bool try_default = true;
  // Split aggregate set edits into one patch per element.
  bool expand = false;
  // Paths below which values are compared as wholes. May be nullptr.
  const PathLimit* path_limit = nullptr;
};

class DiffDriver {
 public:
  virtual ~DiffDriver() = default;

  // Returns the patches turning first into second. table and the objects
  // referenced by options are only used during the call.
  virtual absl::StatusOr<std::vector<Patch>> Drive(
      const Value& first, const Value& second, const ExtractorTable& table,
      const DriveOptions& options) const = 0;
};

// Walks both values top-down. At every node:
//
//  - at a path limit, the values are a leaf;
//  - otherwise the exact extractor for the first value's kind is used if it
//    applies, else (with try_default) the first applicable fallback;
//  - without an extractor, the values are a leaf; two containers of the same
//    kind without one are a FailedPrecondition error when try_default is off.
//
// Leaves yield a change if they differ. Changes reported by an extractor are
// dropped when both values are equal and walked recursively otherwise.
// Inserts and deletes are reported at the node extended by their position.
class RecursiveDiffDriver : public DiffDriver {
 public:
  absl::StatusOr<std::vector<Patch>> Drive(
      const Value& first, const Value& second, const ExtractorTable& table,
      const DriveOptions& options) const override;
};

// Returns a shared RecursiveDiffDriver.
const DiffDriver& DefaultDiffDriver();

}  // namespace structdiff

#endif  // STRUCTDIFF_DIFF_DRIVER_H_
