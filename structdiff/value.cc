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


#include "structdiff/value.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/variant.h"
#include "structdiff/base/logging.h"

namespace structdiff {

namespace {

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

// NaN sorts after every number and equals any other NaN.
int CompareDoubles(double a, double b) {
  const bool a_nan = std::isnan(a);
  const bool b_nan = std::isnan(b);
  if (a_nan || b_nan) return ThreeWay(a_nan, b_nan);
  return ThreeWay(a, b);
}

// Lexicographic comparison of two ranges using Value ordering.
template <typename It, typename ElementCompare>
int CompareRanges(It a_begin, It a_end, It b_begin, It b_end,
                  ElementCompare compare) {
  for (; a_begin != a_end && b_begin != b_end; ++a_begin, ++b_begin) {
    const int c = compare(*a_begin, *b_begin);
    if (c != 0) return c;
  }
  if (a_begin == a_end) return b_begin == b_end ? 0 : -1;
  return 1;
}

struct DebugFormatter {
  void operator()(std::string* out, const Value& value) const {
    out->append(value.DebugString());
  }
};

}  // namespace

Value Value::Bool(bool value) { return Value(Storage(value)); }

Value Value::Int(int64_t value) { return Value(Storage(value)); }

Value Value::Double(double value) { return Value(Storage(value)); }

Value Value::String(absl::string_view value) {
  return Value(Storage(std::string(value)));
}

Value Value::FromList(List items) {
  return Value(Storage(std::make_shared<const List>(std::move(items))));
}

Value Value::FromSet(Set items) {
  return Value(Storage(std::make_shared<const Set>(std::move(items))));
}

Value Value::FromMap(Map items) {
  return Value(Storage(std::make_shared<const Map>(std::move(items))));
}

bool Value::bool_value() const {
  STRUCTDIFF_CHECK_EQ(kind(), kBool) << "is " << KindName(kind());
  return absl::get<bool>(storage_);
}

int64_t Value::int_value() const {
  STRUCTDIFF_CHECK_EQ(kind(), kInt) << "is " << KindName(kind());
  return absl::get<int64_t>(storage_);
}

double Value::double_value() const {
  STRUCTDIFF_CHECK_EQ(kind(), kDouble) << "is " << KindName(kind());
  return absl::get<double>(storage_);
}

const std::string& Value::string_value() const {
  STRUCTDIFF_CHECK_EQ(kind(), kString) << "is " << KindName(kind());
  return absl::get<std::string>(storage_);
}

const Value::List& Value::list() const {
  STRUCTDIFF_CHECK_EQ(kind(), kList) << "is " << KindName(kind());
  return *absl::get<std::shared_ptr<const List>>(storage_);
}

const Value::Set& Value::set() const {
  STRUCTDIFF_CHECK_EQ(kind(), kSet) << "is " << KindName(kind());
  return *absl::get<std::shared_ptr<const Set>>(storage_);
}

const Value::Map& Value::map() const {
  STRUCTDIFF_CHECK_EQ(kind(), kMap) << "is " << KindName(kind());
  return *absl::get<std::shared_ptr<const Map>>(storage_);
}

size_t Value::size() const {
  switch (kind()) {
    case kList:
      return list().size();
    case kSet:
      return set().size();
    case kMap:
      return map().size();
    default:
      return 0;
  }
}

std::string Value::ToString() const {
  switch (kind()) {
    case kNull:
      return "null";
    case kBool:
      return bool_value() ? "true" : "false";
    case kInt:
      return absl::StrCat(int_value());
    case kDouble:
      return absl::StrCat(double_value());
    case kString:
      return string_value();
    default:
      return DebugString();
  }
}

std::string Value::DebugString() const {
  switch (kind()) {
    case kString:
      return absl::StrCat("\"", absl::CHexEscape(string_value()), "\"");
    case kList:
      return absl::StrCat("[", absl::StrJoin(list(), ", ", DebugFormatter()),
                          "]");
    case kSet:
      return absl::StrCat("{", absl::StrJoin(set(), ", ", DebugFormatter()),
                          "}");
    case kMap:
      return absl::StrCat(
          "{",
          absl::StrJoin(map(), ", ",
                        [](std::string* out, const Map::value_type& entry) {
                          absl::StrAppend(out, entry.first.DebugString(), ": ",
                                          entry.second.DebugString());
                        }),
          "}");
    default:
      return ToString();
  }
}

int Value::Compare(const Value& a, const Value& b) {
  if (a.kind() != b.kind()) return ThreeWay(a.kind(), b.kind());
  switch (a.kind()) {
    case kNull:
      return 0;
    case kBool:
      return ThreeWay(a.bool_value(), b.bool_value());
    case kInt:
      return ThreeWay(a.int_value(), b.int_value());
    case kDouble:
      return CompareDoubles(a.double_value(), b.double_value());
    case kString:
      return a.string_value().compare(b.string_value());
    case kList:
      return CompareRanges(a.list().begin(), a.list().end(), b.list().begin(),
                           b.list().end(), &Value::Compare);
    case kSet:
      return CompareRanges(a.set().begin(), a.set().end(), b.set().begin(),
                           b.set().end(), &Value::Compare);
    case kMap:
      return CompareRanges(
          a.map().begin(), a.map().end(), b.map().begin(), b.map().end(),
          [](const Map::value_type& x, const Map::value_type& y) {
            const int c = Compare(x.first, y.first);
            return c != 0 ? c : Compare(x.second, y.second);
          });
  }
  return 0;
}

bool operator==(const Value& a, const Value& b) {
  return Value::Compare(a, b) == 0;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.DebugString();
}

const char* KindName(Value::Kind kind) {
  switch (kind) {
    case Value::kNull:
      return "null";
    case Value::kBool:
      return "bool";
    case Value::kInt:
      return "int";
    case Value::kDouble:
      return "double";
    case Value::kString:
      return "string";
    case Value::kList:
      return "list";
    case Value::kSet:
      return "set";
    case Value::kMap:
      return "map";
  }
  return "unknown";
}

}  // namespace structdiff
