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


// Entry point for diffing two nested values.
//
//   ExtractorRegistry registry;
//   absl::StatusOr<std::vector<Patch>> patches = registry.Extract(a, b);
//
// Lists are diffed index by index by default. To align them on their longest
// common subsequence instead:
//
//   ExtractorUpdate update;
//   update.by_kind[Value::kList] = ExtractorKind::kAlignment;
//   ExtractorRegistry registry(update);
#ifndef STRUCTDIFF_EXTRACTOR_REGISTRY_H_
#define STRUCTDIFF_EXTRACTOR_REGISTRY_H_

#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/flags/declare.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "structdiff/diff_driver.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/value.h"

ABSL_DECLARE_FLAG(bool, structdiff_try_default);

namespace structdiff {

// Configuration of an ExtractorRegistry.
class ExtractionOptions {
 public:
  // try_default starts out as --structdiff_try_default.
  ExtractionOptions();

  // Keys excluded from comparison. Empty by default.
  const IgnoreSet& ignore() const { return ignore_; }
  void set_ignore(IgnoreSet ignore) { ignore_ = std::move(ignore); }

  // Whether the fallback extractors are tried when no exact entry applies.
  bool try_default() const { return try_default_; }
  void set_try_default(bool try_default) { try_default_ = try_default; }

  // Split aggregate set edits into one patch per element. Off by default.
  bool expand() const { return expand_; }
  void set_expand(bool expand) { expand_ = expand; }

  // Where recursion stops. Unlimited by default.
  const PathLimit& path_limit() const { return path_limit_; }
  void set_path_limit(PathLimit path_limit) {
    path_limit_ = std::move(path_limit);
  }

 private:
  IgnoreSet ignore_;
  bool try_default_;
  bool expand_ = false;
  PathLimit path_limit_;
};

// Changes to the default extractor table. Entries of by_kind replace the
// default for that kind; a fallback replaces the whole default fallback list.
struct ExtractorUpdate {
  absl::flat_hash_map<Value::Kind, ExtractorKind> by_kind;
  absl::optional<std::vector<ExtractorKind>> fallback;
};

// Returns the default table, with every kind entry and the fallback list set:
//
//   kMap  -> kMap
//   kList -> kPositional
//   kSet  -> kUnordered
//   fallback: kMap, kPositional, kUnordered
ExtractorUpdate DefaultExtractors();

// Maps value kinds to extractors and runs the diff driver with them, starting
// from DefaultExtractors() with the given update applied.
//
// A registry is immutable after construction and may be shared between
// threads.
class ExtractorRegistry : public ExtractorTable {
 public:
  ExtractorRegistry();
  explicit ExtractorRegistry(const ExtractorUpdate& update);
  ExtractorRegistry(const ExtractorUpdate& update, ExtractionOptions options);

  // The driver must outlive the registry. Defaults to DefaultDiffDriver().
  ExtractorRegistry(const ExtractorUpdate& update, ExtractionOptions options,
                    const DiffDriver* driver);

  ExtractorRegistry(const ExtractorRegistry&) = delete;
  ExtractorRegistry& operator=(const ExtractorRegistry&) = delete;

  // Returns the fully qualified patches turning first into second.
  absl::StatusOr<std::vector<Patch>> Extract(const Value& first,
                                             const Value& second) const;

  const Extractor* FindExact(Value::Kind kind) const override;
  const std::vector<const Extractor*>& fallback() const override {
    return fallback_;
  }

  const ExtractionOptions& options() const { return options_; }

 private:
  absl::flat_hash_map<Value::Kind, const Extractor*> by_kind_;
  std::vector<const Extractor*> fallback_;
  const ExtractionOptions options_;
  const DiffDriver* const driver_;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_EXTRACTOR_REGISTRY_H_
