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


#include "structdiff/extractor_registry.h"

#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/statusor.h"
#include "structdiff/base/logging.h"

ABSL_FLAG(bool, structdiff_try_default, true,
          "Whether values without an applicable extractor for their kind are "
          "offered to the fallback extractors.");

namespace structdiff {

ExtractorUpdate DefaultExtractors() {
  ExtractorUpdate defaults;
  defaults.by_kind[Value::kMap] = ExtractorKind::kMap;
  defaults.by_kind[Value::kList] = ExtractorKind::kPositional;
  defaults.by_kind[Value::kSet] = ExtractorKind::kUnordered;
  defaults.fallback = std::vector<ExtractorKind>{
      ExtractorKind::kMap, ExtractorKind::kPositional,
      ExtractorKind::kUnordered};
  return defaults;
}

ExtractionOptions::ExtractionOptions()
    : try_default_(absl::GetFlag(FLAGS_structdiff_try_default)) {}

ExtractorRegistry::ExtractorRegistry()
    : ExtractorRegistry(ExtractorUpdate()) {}

ExtractorRegistry::ExtractorRegistry(const ExtractorUpdate& update)
    : ExtractorRegistry(update, ExtractionOptions()) {}

ExtractorRegistry::ExtractorRegistry(const ExtractorUpdate& update,
                                     ExtractionOptions options)
    : ExtractorRegistry(update, std::move(options), &DefaultDiffDriver()) {}

ExtractorRegistry::ExtractorRegistry(const ExtractorUpdate& update,
                                     ExtractionOptions options,
                                     const DiffDriver* driver)
    : options_(std::move(options)), driver_(driver) {
  STRUCTDIFF_CHECK(driver_ != nullptr);
  const ExtractorUpdate defaults = DefaultExtractors();
  for (const auto& entry : defaults.by_kind) {
    by_kind_[entry.first] = &GetExtractor(entry.second);
  }
  for (const auto& entry : update.by_kind) {
    by_kind_[entry.first] = &GetExtractor(entry.second);
  }

  for (ExtractorKind kind : update.fallback.value_or(*defaults.fallback)) {
    fallback_.push_back(&GetExtractor(kind));
  }
}

const Extractor* ExtractorRegistry::FindExact(Value::Kind kind) const {
  auto it = by_kind_.find(kind);
  return it == by_kind_.end() ? nullptr : it->second;
}

absl::StatusOr<std::vector<Patch>> ExtractorRegistry::Extract(
    const Value& first, const Value& second) const {
  DriveOptions drive;
  drive.ignore = &options_.ignore();
  drive.try_default = options_.try_default();
  drive.expand = options_.expand();
  drive.path_limit = &options_.path_limit();
  STRUCTDIFF_VLOG(1) << "Extracting " << KindName(first.kind()) << " vs "
                     << KindName(second.kind());
  return driver_->Drive(first, second, *this, drive);
}

}  // namespace structdiff
