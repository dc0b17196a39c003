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


// Paths into nested values and the two path based policies consulted while
// diffing: ignore sets (which keys are excluded from comparison) and path
// limits (where the driver stops recursing).
#ifndef STRUCTDIFF_NODE_PATH_H_
#define STRUCTDIFF_NODE_PATH_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "structdiff/value.h"

namespace structdiff {

// Sequence of map keys and list indices (kInt) leading from the root to a
// node. The root is the empty path.
using Path = std::vector<Value>;

// Returns node extended by one segment.
Path ChildPath(const Path& node, const Value& segment);

// Joins the segments' ToString() with ".". The root renders as "".
std::string DottedPath(const Path& path);

// Appends key to an already dotted node, without a leading dot at the root.
std::string DottedChild(absl::string_view dotted_node, const Value& key);

// Readable form for logs, e.g. ["a", 0, "b"].
std::string PathDebugString(const Path& path);

enum class IgnoreMode {
  // Entries are dotted strings like "a.b.0".
  kDotted,
  // Entries are segment lists; keys keep their kind, so "1" and 1 differ.
  kSegments,
};

// Set of paths whose keys are suppressed from comparison. An entry names a
// key relative to the root; a key is ignored if the path to it is an entry.
// A default constructed IgnoreSet ignores nothing.
class IgnoreSet {
 public:
  IgnoreSet() : mode_(IgnoreMode::kDotted) {}

  static IgnoreSet Dotted(const std::vector<std::string>& paths);
  static IgnoreSet Segments(const std::vector<Path>& paths);

  IgnoreMode mode() const { return mode_; }
  bool empty() const { return dotted_.empty() && segments_.empty(); }

  // Returns true if key below node is ignored. dotted_node must be
  // DottedPath(node); only the form matching mode() is inspected.
  bool Contains(const Path& node, absl::string_view dotted_node,
                const Value& key) const;

 private:
  explicit IgnoreSet(IgnoreMode mode) : mode_(mode) {}

  IgnoreMode mode_;
  absl::flat_hash_set<std::string> dotted_;
  absl::flat_hash_set<Path> segments_;
};

// Bounds the recursion of the diff driver. A path is a limit if it equals
// one of the configured paths or reaches the maximum depth. Values at a
// limit are compared as wholes. Default constructed, nothing is a limit.
class PathLimit {
 public:
  PathLimit() = default;

  explicit PathLimit(const std::vector<Path>& paths);

  void AddLimit(const Path& path) { paths_.insert(path); }

  // Paths with at least max_depth segments are limits. A max_depth of 0
  // makes the root a limit.
  void set_max_depth(int max_depth) { max_depth_ = max_depth; }
  absl::optional<int> max_depth() const { return max_depth_; }

  bool IsLimit(const Path& path) const;

 private:
  absl::flat_hash_set<Path> paths_;
  absl::optional<int> max_depth_;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_NODE_PATH_H_
