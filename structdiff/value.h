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


#ifndef STRUCTDIFF_VALUE_H_
#define STRUCTDIFF_VALUE_H_

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/variant.h"

namespace structdiff {

// An immutable nested value: a scalar or a container of values. Containers
// share their payload, so copying a Value is O(1) regardless of its size.
//
//   Value doc = Value::FromMap({{Value::String("a"), Value::Int(1)}});
//   if (doc.kind() == Value::kMap) ...
//
// Equality is structural. operator< is a total order (kind first, then
// payload) which lets values serve as keys of ordered containers. Double
// comparison treats NaN as equal to NaN and greater than every number, so
// that both orders agree.
class Value {
 public:
  // Order matters: it is the rank used by operator<.
  enum Kind {
    kNull = 0,
    kBool,
    kInt,
    kDouble,
    kString,
    kList,
    kSet,
    kMap,
  };

  using List = std::vector<Value>;
  using Set = std::set<Value>;
  using Map = std::map<Value, Value>;

  // Constructs a null value.
  Value() = default;

  static Value Null() { return Value(); }
  static Value Bool(bool value);
  static Value Int(int64_t value);
  static Value Double(double value);
  static Value String(absl::string_view value);
  static Value FromList(List items);
  static Value FromSet(Set items);
  static Value FromMap(Map items);

  Kind kind() const { return static_cast<Kind>(storage_.index()); }

  // Lists, sets and maps.
  bool is_container() const { return kind() >= kList; }

  // Only scalars may be used as map keys or set elements.
  bool IsHashable() const { return !is_container(); }

  // Accessors. Calling one that does not match kind() is a fatal error.
  bool bool_value() const;
  int64_t int_value() const;
  double double_value() const;
  const std::string& string_value() const;
  const List& list() const;
  const Set& set() const;
  const Map& map() const;

  // Number of elements of a container, 0 for scalars.
  size_t size() const;

  // Renders the value as a path segment: strings verbatim, numbers in
  // decimal, "true"/"false" and "null". Containers use DebugString().
  std::string ToString() const;

  // Readable form for logs and error messages, e.g. {"a": [1, 2.5, null]}.
  std::string DebugString() const;

  friend bool operator==(const Value& a, const Value& b);
  friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }
  friend bool operator<(const Value& a, const Value& b) {
    return Compare(a, b) < 0;
  }
  friend bool operator>(const Value& a, const Value& b) { return b < a; }
  friend bool operator<=(const Value& a, const Value& b) { return !(b < a); }
  friend bool operator>=(const Value& a, const Value& b) { return !(a < b); }

 private:
  using Storage =
      absl::variant<absl::monostate, bool, int64_t, double, std::string,
                    std::shared_ptr<const List>, std::shared_ptr<const Set>,
                    std::shared_ptr<const Map>>;

  explicit Value(Storage storage) : storage_(std::move(storage)) {}

  // Returns <0, 0 or >0.
  static int Compare(const Value& a, const Value& b);

  Storage storage_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

const char* KindName(Value::Kind kind);

// The kind is combined last, so every expansion ends with it and no
// expansion is a suffix of another one of a different kind.
template <typename H>
H AbslHashValue(H h, const Value& value) {
  switch (value.kind()) {
    case Value::kNull:
      break;
    case Value::kBool:
      h = H::combine(std::move(h), value.bool_value());
      break;
    case Value::kInt:
      h = H::combine(std::move(h), value.int_value());
      break;
    case Value::kDouble: {
      // All NaNs are equal to each other.
      const double d = value.double_value();
      if (std::isnan(d)) {
        h = H::combine(std::move(h), true);
      } else {
        h = H::combine(std::move(h), d, false);
      }
      break;
    }
    case Value::kString:
      h = H::combine(std::move(h), value.string_value());
      break;
    case Value::kList:
      for (const Value& item : value.list()) {
        h = H::combine(std::move(h), item);
      }
      h = H::combine(std::move(h), value.list().size());
      break;
    case Value::kSet:
      for (const Value& item : value.set()) {
        h = H::combine(std::move(h), item);
      }
      h = H::combine(std::move(h), value.set().size());
      break;
    case Value::kMap:
      for (const auto& entry : value.map()) {
        h = H::combine(std::move(h), entry.first, entry.second);
      }
      h = H::combine(std::move(h), value.map().size());
      break;
  }
  return H::combine(std::move(h), static_cast<int>(value.kind()));
}

}  // namespace structdiff

#endif  // STRUCTDIFF_VALUE_H_
