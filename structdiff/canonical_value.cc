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


#include "structdiff/canonical_value.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/hash/hash.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "structdiff/base/status_builder.h"
#include "structdiff/base/status_macros.h"
#include "structdiff/value.h"

namespace structdiff {

absl::StatusOr<CanonicalValue> CanonicalValue::Canonicalize(
    const Value& value) {
  switch (value.kind()) {
    case Value::kList: {
      CanonicalValue tuple(kTuple);
      tuple.elements_.reserve(value.list().size());
      for (const Value& item : value.list()) {
        STRUCTDIFF_ASSIGN_OR_RETURN(CanonicalValue element,
                                    Canonicalize(item));
        tuple.elements_.push_back(std::move(element));
      }
      return tuple;
    }
    case Value::kSet: {
      // std::set already iterates in sorted order.
      CanonicalValue sorted(kSortedSet);
      sorted.elements_.reserve(value.set().size());
      for (const Value& item : value.set()) {
        if (!item.IsHashable()) {
          return structdiff_base::InvalidArgumentErrorBuilder()
                 << "unhashable set element " << item.DebugString();
        }
        STRUCTDIFF_ASSIGN_OR_RETURN(CanonicalValue element,
                                    Canonicalize(item));
        sorted.elements_.push_back(std::move(element));
      }
      return sorted;
    }
    case Value::kMap: {
      CanonicalValue digest(kMapDigest);
      digest.digest_ = absl::Hash<Value>()(value);
      digest.value_ = value;
      return digest;
    }
    default: {
      CanonicalValue scalar(kScalar);
      scalar.value_ = value;
      return scalar;
    }
  }
}

bool operator==(const CanonicalValue& a, const CanonicalValue& b) {
  if (a.kind_ != b.kind_) return false;
  switch (a.kind_) {
    case CanonicalValue::kScalar:
      return a.value_ == b.value_;
    case CanonicalValue::kTuple:
    case CanonicalValue::kSortedSet:
      return a.elements_ == b.elements_;
    case CanonicalValue::kMapDigest:
      // Digests may collide; the maps decide.
      return a.digest_ == b.digest_ && a.value_ == b.value_;
  }
  return false;
}

std::string CanonicalValue::DebugString() const {
  const auto join = [this]() {
    return absl::StrJoin(elements_, ", ",
                         [](std::string* out, const CanonicalValue& element) {
                           out->append(element.DebugString());
                         });
  };
  switch (kind_) {
    case kScalar:
      return value_.DebugString();
    case kTuple:
      return absl::StrCat("(", join(), ")");
    case kSortedSet:
      return absl::StrCat("sorted(", join(), ")");
    case kMapDigest:
      return absl::StrCat("map#", digest_);
  }
  return "";
}

}  // namespace structdiff
