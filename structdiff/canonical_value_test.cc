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

#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/container/flat_hash_set.h"
#include "absl/hash/hash.h"
#include "absl/status/status.h"
#include "structdiff/base/logging.h"
#include "structdiff/base/status_matchers.h"
#include "structdiff/test_util.h"

namespace structdiff {
namespace {

using ::structdiff_base::testing::StatusIs;
using ::testing::HasSubstr;
using ::testing::SizeIs;
using testing::D;
using testing::I;
using testing::L;
using testing::M;
using testing::S;
using testing::Set;

CanonicalValue Canon(const Value& value) {
  absl::StatusOr<CanonicalValue> canonical =
      CanonicalValue::Canonicalize(value);
  STRUCTDIFF_CHECK(canonical.ok()) << canonical.status();
  return *canonical;
}

TEST(CanonicalValueTest, ScalarsAreUnchanged) {
  const CanonicalValue canonical = Canon(S("a"));
  EXPECT_EQ(CanonicalValue::kScalar, canonical.kind());
  EXPECT_EQ(S("a"), canonical.scalar());
  EXPECT_EQ(Canon(I(1)), Canon(I(1)));
  EXPECT_NE(Canon(I(1)), Canon(D(1.0)));
  EXPECT_EQ(Canon(D(std::numeric_limits<double>::quiet_NaN())),
            Canon(D(std::numeric_limits<double>::quiet_NaN())));
}

TEST(CanonicalValueTest, ListsBecomeTuples) {
  const CanonicalValue canonical = Canon(L({I(1), L({S("x")})}));
  EXPECT_EQ(CanonicalValue::kTuple, canonical.kind());
  ASSERT_THAT(canonical.elements(), SizeIs(2));
  EXPECT_EQ(CanonicalValue::kTuple, canonical.elements()[1].kind());
  EXPECT_EQ("(1, (\"x\"))", canonical.DebugString());
  EXPECT_NE(Canon(L({I(1), I(2)})), Canon(L({I(2), I(1)})));
}

TEST(CanonicalValueTest, SetsCompareStructurally) {
  const CanonicalValue canonical = Canon(Set({I(3), I(1), I(2)}));
  EXPECT_EQ(CanonicalValue::kSortedSet, canonical.kind());
  EXPECT_EQ("sorted(1, 2, 3)", canonical.DebugString());
  EXPECT_EQ(canonical, Canon(Set({I(2), I(3), I(1)})));
  EXPECT_NE(canonical, Canon(Set({I(1), I(2)})));
  // A set is never equal to a list with the same elements.
  EXPECT_NE(canonical, Canon(L({I(1), I(2), I(3)})));
}

TEST(CanonicalValueTest, UnhashableSetElement) {
  EXPECT_THAT(CanonicalValue::Canonicalize(L({Set({L({I(1)})})})),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unhashable set element [1]")));
}

TEST(CanonicalValueTest, MapsCollapseToDigest) {
  const Value map = M({{S("a"), L({I(1)})}, {S("b"), I(2)}});
  const CanonicalValue canonical = Canon(map);
  EXPECT_EQ(CanonicalValue::kMapDigest, canonical.kind());
  EXPECT_EQ(absl::Hash<Value>()(map), canonical.digest());
  EXPECT_EQ(canonical, Canon(M({{S("b"), I(2)}, {S("a"), L({I(1)})}})));
  EXPECT_NE(canonical, Canon(M({{S("a"), L({I(1)})}})));
  // Maps are opaque: their values are never canonicalized.
  EXPECT_TRUE(CanonicalValue::Canonicalize(M({{S("s"), Set({I(1)})}})).ok());
}

TEST(CanonicalValueTest, HashMatchesEquality) {
  absl::flat_hash_set<CanonicalValue> seen;
  seen.insert(Canon(L({I(1), Set({I(2), I(3)})})));
  seen.insert(Canon(L({I(1), Set({I(3), I(2)})})));
  seen.insert(Canon(M({{S("k"), I(1)}})));
  seen.insert(Canon(M({{S("k"), I(1)}})));
  seen.insert(Canon(S("k")));
  EXPECT_THAT(seen, SizeIs(3));
}

}  // namespace
}  // namespace structdiff
