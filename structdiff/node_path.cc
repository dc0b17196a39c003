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


#include "structdiff/node_path.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "structdiff/value.h"

namespace structdiff {

Path ChildPath(const Path& node, const Value& segment) {
  Path child;
  child.reserve(node.size() + 1);
  child.insert(child.end(), node.begin(), node.end());
  child.push_back(segment);
  return child;
}

std::string DottedPath(const Path& path) {
  return absl::StrJoin(path, ".", [](std::string* out, const Value& segment) {
    out->append(segment.ToString());
  });
}

std::string DottedChild(absl::string_view dotted_node, const Value& key) {
  if (dotted_node.empty()) return key.ToString();
  return absl::StrCat(dotted_node, ".", key.ToString());
}

std::string PathDebugString(const Path& path) {
  return absl::StrCat(
      "[",
      absl::StrJoin(path, ", ",
                    [](std::string* out, const Value& segment) {
                      out->append(segment.DebugString());
                    }),
      "]");
}

IgnoreSet IgnoreSet::Dotted(const std::vector<std::string>& paths) {
  IgnoreSet ignore(IgnoreMode::kDotted);
  ignore.dotted_.insert(paths.begin(), paths.end());
  return ignore;
}

IgnoreSet IgnoreSet::Segments(const std::vector<Path>& paths) {
  IgnoreSet ignore(IgnoreMode::kSegments);
  ignore.segments_.insert(paths.begin(), paths.end());
  return ignore;
}

bool IgnoreSet::Contains(const Path& node, absl::string_view dotted_node,
                         const Value& key) const {
  switch (mode_) {
    case IgnoreMode::kDotted:
      return !dotted_.empty() &&
             dotted_.contains(DottedChild(dotted_node, key));
    case IgnoreMode::kSegments:
      return !segments_.empty() && segments_.contains(ChildPath(node, key));
  }
  return false;
}

PathLimit::PathLimit(const std::vector<Path>& paths)
    : paths_(paths.begin(), paths.end()) {}

bool PathLimit::IsLimit(const Path& path) const {
  if (max_depth_.has_value() &&
      static_cast<int>(path.size()) >= *max_depth_) {
    return true;
  }
  return paths_.contains(path);
}

}  // namespace structdiff
