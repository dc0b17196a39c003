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


#ifndef STRUCTDIFF_CANONICAL_VALUE_H_
#define STRUCTDIFF_CANONICAL_VALUE_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "structdiff/value.h"

namespace structdiff {

// Hashable projection of a Value used to align sequences element by
// element. The projection is lossy and only ever compared with other
// projections; patches always carry the original values.
//
//   list   -> tuple of canonical elements
//   set    -> sorted set of canonical elements; never equal to a tuple
//   map    -> opaque digest, equal only to a digest of an equal map
//   scalar -> itself
class CanonicalValue {
 public:
  enum Kind {
    kScalar,
    kTuple,
    kSortedSet,
    kMapDigest,
  };

  // Fails with InvalidArgument if a set holds an unhashable element.
  static absl::StatusOr<CanonicalValue> Canonicalize(const Value& value);

  Kind kind() const { return kind_; }

  // Valid for kScalar.
  const Value& scalar() const { return value_; }

  // Valid for kTuple and kSortedSet.
  const std::vector<CanonicalValue>& elements() const { return elements_; }

  // Valid for kMapDigest.
  size_t digest() const { return digest_; }

  std::string DebugString() const;

  friend bool operator==(const CanonicalValue& a, const CanonicalValue& b);
  friend bool operator!=(const CanonicalValue& a, const CanonicalValue& b) {
    return !(a == b);
  }

  template <typename H>
  friend H AbslHashValue(H h, const CanonicalValue& value) {
    h = H::combine(std::move(h), static_cast<int>(value.kind_));
    switch (value.kind_) {
      case kScalar:
        return H::combine(std::move(h), value.value_);
      case kTuple:
      case kSortedSet:
        for (const CanonicalValue& element : value.elements_) {
          h = H::combine(std::move(h), element);
        }
        return H::combine(std::move(h), value.elements_.size());
      case kMapDigest:
        return H::combine(std::move(h), value.digest_);
    }
    return h;
  }

 private:
  explicit CanonicalValue(Kind kind) : kind_(kind) {}

  Kind kind_;
  // The scalar for kScalar, the original map for kMapDigest.
  Value value_;
  std::vector<CanonicalValue> elements_;
  size_t digest_ = 0;
};

}  // namespace structdiff

#endif  // STRUCTDIFF_CANONICAL_VALUE_H_
