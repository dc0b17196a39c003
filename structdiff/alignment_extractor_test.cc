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


#include "structdiff/alignment_extractor.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "structdiff/base/status_matchers.h"
#include "structdiff/opcode.h"
#include "structdiff/patch.h"
#include "structdiff/test_util.h"

namespace structdiff {
namespace {

using ::structdiff_base::testing::IsOkAndHolds;
using ::structdiff_base::testing::StatusIs;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using testing::FlagSetter;
using testing::I;
using testing::L;
using testing::M;
using testing::S;
using testing::Set;

absl::StatusOr<std::vector<MetaPatch>> Extract(const Value& first,
                                               const Value& second,
                                               const Path& node = {}) {
  return CollectPatches(AlignmentExtractor().Extract(
      first, second, node, DottedPath(node), nullptr));
}

// Extracts the patches and checks that replaying them on first gives second.
void ExpectReplays(const Value& first, const Value& second) {
  STRUCTDIFF_ASSERT_OK_AND_ASSIGN(std::vector<MetaPatch> patches,
                                  Extract(first, second));
  EXPECT_THAT(testing::ApplyListPatches(first, patches), IsOkAndHolds(second))
      << first << " -> " << second;
}

TEST(IndexShiftTest, Remap) {
  const IndexShift shift;
  EXPECT_EQ(5, shift.Remap(5));
  const IndexShift moved = shift.WithInsertions(3).WithDeletions(1);
  EXPECT_EQ(3, moved.inserted());
  EXPECT_EQ(1, moved.deleted());
  EXPECT_EQ(7, moved.Remap(5));
  EXPECT_TRUE(moved == IndexShift(3, 1));
  EXPECT_TRUE(shift == IndexShift());
}

TEST(TranslateOpcodeTest, Equal) {
  std::vector<MetaPatch> patches;
  const IndexShift shift = TranslateOpcode(Opcode(UNCHANGED, 0, 2, 1, 3),
                                           IndexShift(1, 0), {I(1), I(2)},
                                           {I(0), I(1), I(2)}, &patches);
  EXPECT_TRUE(shift == IndexShift(1, 0));
  EXPECT_THAT(patches, IsEmpty());
}

TEST(TranslateOpcodeTest, Insert) {
  const Value::List first = {I(0), I(1), I(2)};
  const Value::List second = {S("x"), S("y")};
  std::vector<MetaPatch> patches;
  const IndexShift shift =
      TranslateOpcode(Opcode(ADDED, 3, 3, 0, 2), IndexShift(2, 1), first,
                      second, &patches);
  EXPECT_TRUE(shift == IndexShift(4, 1));
  EXPECT_THAT(patches, ElementsAre(MetaPatch::Insert(I(4), I(0), S("x")),
                                   MetaPatch::Insert(I(5), I(1), S("y"))));
}

TEST(TranslateOpcodeTest, DeleteFromTheBack) {
  const Value::List first = {I(0), I(1), I(2), I(3)};
  std::vector<MetaPatch> patches;
  const IndexShift shift = TranslateOpcode(
      Opcode(REMOVED, 1, 3, 1, 1), IndexShift(1, 0), first, {}, &patches);
  EXPECT_TRUE(shift == IndexShift(1, 2));
  EXPECT_THAT(patches, ElementsAre(MetaPatch::Delete(I(3), I(3), I(2)),
                                   MetaPatch::Delete(I(2), I(2), I(1))));
}

TEST(TranslateOpcodeTest, ReplaceWithLongerTarget) {
  const Value::List first = {S("a"), S("b")};
  const Value::List second = {S("x"), S("y"), S("z")};
  std::vector<MetaPatch> patches;
  const IndexShift shift = TranslateOpcode(Opcode(CHANGED, 0, 2, 0, 3),
                                           IndexShift(), first, second,
                                           &patches);
  EXPECT_TRUE(shift == IndexShift(1, 0));
  EXPECT_THAT(patches,
              ElementsAre(MetaPatch::Change(I(0), I(0), S("a"), S("x")),
                          MetaPatch::Change(I(1), I(1), S("b"), S("y")),
                          MetaPatch::Insert(I(2), I(2), S("z"))));
}

TEST(TranslateOpcodeTest, ReplaceWithLongerSource) {
  const Value::List first = {S("p"), S("a"), S("b"), S("c")};
  const Value::List second = {S("x"), S("y")};
  std::vector<MetaPatch> patches;
  const IndexShift shift = TranslateOpcode(Opcode(CHANGED, 1, 4, 1, 2),
                                           IndexShift(0, 1), first, second,
                                           &patches);
  EXPECT_TRUE(shift == IndexShift(0, 3));
  EXPECT_THAT(patches,
              ElementsAre(MetaPatch::Change(I(0), I(1), S("a"), S("y")),
                          MetaPatch::Delete(I(2), I(2), S("c")),
                          MetaPatch::Delete(I(1), I(1), S("b"))));
}

TEST(AlignmentExtractorTest, IsApplicable) {
  const AlignmentExtractor extractor;
  EXPECT_EQ(ExtractorKind::kAlignment, extractor.kind());
  EXPECT_TRUE(extractor.IsApplicable(L({}), L({})));
  EXPECT_FALSE(extractor.IsApplicable(L({}), Set({})));
}

TEST(AlignmentExtractorTest, DeleteAndAppend) {
  const Value first = L({I(1), I(2), I(3), I(4)});
  const Value second = L({I(1), I(3), I(4), I(5)});
  EXPECT_THAT(Extract(first, second),
              IsOkAndHolds(ElementsAre(MetaPatch::Delete(I(1), I(1), I(2)),
                                       MetaPatch::Insert(I(3), I(3), I(5)))));
  ExpectReplays(first, second);
}

TEST(AlignmentExtractorTest, ReplaceOfUnequalLength) {
  const Value first = L({S("a"), S("b")});
  const Value second = L({S("x"), S("y"), S("z")});
  EXPECT_THAT(Extract(first, second),
              IsOkAndHolds(ElementsAre(
                  MetaPatch::Change(I(0), I(0), S("a"), S("x")),
                  MetaPatch::Change(I(1), I(1), S("b"), S("y")),
                  MetaPatch::Insert(I(2), I(2), S("z")))));
  ExpectReplays(first, second);
}

TEST(AlignmentExtractorTest, InsertInFront) {
  EXPECT_THAT(Extract(L({I(1), I(2)}), L({I(0), I(1), I(2)})),
              IsOkAndHolds(ElementsAre(MetaPatch::Insert(I(0), I(0), I(0)))));
}

TEST(AlignmentExtractorTest, NestedValuesMatchStructurally) {
  const Value first = L({L({I(1), I(2)}), Set({I(1), I(2)}),
                         M({{S("a"), I(1)}})});
  const Value second = L({L({I(1), I(2)}), Set({I(2), I(1)}),
                          M({{S("a"), I(1)}}), I(3)});
  EXPECT_THAT(Extract(first, second),
              IsOkAndHolds(ElementsAre(MetaPatch::Insert(I(3), I(3), I(3)))));

  // Maps are matched as wholes; a changed map is replaced.
  const Value changed = L({L({I(1), I(2)}), Set({I(1), I(2)}),
                           M({{S("a"), I(2)}})});
  EXPECT_THAT(Extract(first, changed),
              IsOkAndHolds(ElementsAre(MetaPatch::Change(
                  I(2), I(2), M({{S("a"), I(1)}}), M({{S("a"), I(2)}})))));
}

TEST(AlignmentExtractorTest, IdenticalListsYieldNothing) {
  const Value list = L({I(1), L({S("x")}), Set({I(4)}), M({})});
  EXPECT_THAT(Extract(list, list), IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(Extract(L({}), L({})), IsOkAndHolds(IsEmpty()));
}

TEST(AlignmentExtractorTest, InterleavedEdits) {
  ExpectReplays(L({I(1), I(2), I(3), I(4), I(5), I(6), I(7)}),
                L({I(0), I(2), I(9), I(9), I(9), I(5), I(7), I(8)}));
  ExpectReplays(L({I(1), I(2), I(3), I(4), I(5)}), L({I(5), I(4), I(3)}));
  ExpectReplays(L({I(1), I(1), I(1)}), L({}));
  ExpectReplays(L({}), L({I(1), I(1), I(1)}));
}

TEST(AlignmentExtractorTest, RandomListsReplay) {
  absl::BitGen gen;
  for (int i = 0; i < 200; ++i) {
    const Value first =
        testing::RandomList(gen, absl::Uniform<int>(gen, 0, 30), 5);
    const Value second =
        testing::RandomList(gen, absl::Uniform<int>(gen, 0, 30), 5);
    ExpectReplays(first, second);
  }
}

TEST(AlignmentExtractorTest, RandomListsReplayWithLittleMemory) {
  // Forces the linear-memory alignment for all but the smallest inputs.
  FlagSetter memory(&FLAGS_structdiff_lcs_max_memory, 512);
  absl::BitGen gen;
  for (int i = 0; i < 100; ++i) {
    const Value first =
        testing::RandomList(gen, absl::Uniform<int>(gen, 0, 30), 3);
    const Value second =
        testing::RandomList(gen, absl::Uniform<int>(gen, 0, 30), 3);
    ExpectReplays(first, second);
  }
}

TEST(AlignmentExtractorTest, MemoryLimitExceeded) {
  FlagSetter memory(&FLAGS_structdiff_lcs_max_memory, 8);
  Value::List first;
  Value::List second;
  for (int i = 0; i < 50; ++i) {
    first.push_back(I(i));
    second.push_back(I(i % 5 == 0 ? i : i + 100));
  }
  EXPECT_THAT(Extract(Value::FromList(first), Value::FromList(second),
                      {S("k")}),
              StatusIs(absl::StatusCode::kResourceExhausted,
                       AllOf(HasSubstr("memory limit"),
                             HasSubstr("at [\"k\"]"))));
}

TEST(AlignmentExtractorTest, LongListsWithFewChanges) {
  Value::List first;
  for (int i = 0; i < 140000; ++i) first.push_back(I(i));
  Value::List second = first;
  // Changing both ends leaves no common prefix or suffix to trim.
  second.front() = S("x");
  second.back() = S("y");
  STRUCTDIFF_ASSERT_OK_AND_ASSIGN(
      std::vector<MetaPatch> patches,
      Extract(Value::FromList(first), Value::FromList(second)));
  EXPECT_THAT(patches,
              ElementsAre(MetaPatch::Change(I(0), I(0), I(0), S("x")),
                          MetaPatch::Change(I(139999), I(139999), I(139999),
                                            S("y"))));
}

TEST(AlignmentExtractorTest, LongDisjointLists) {
  Value::List first;
  Value::List second;
  for (int i = 0; i < 140000; ++i) {
    first.push_back(I(i));
    second.push_back(I(-1 - i));
  }
  STRUCTDIFF_ASSERT_OK_AND_ASSIGN(
      std::vector<MetaPatch> patches,
      Extract(Value::FromList(first), Value::FromList(second)));
  ASSERT_EQ(140000, patches.size());
  EXPECT_EQ(MetaPatch::Change(I(0), I(0), I(0), I(-1)), patches.front());
  EXPECT_EQ(MetaPatch::Change(I(139999), I(139999), I(139999), I(-140000)),
            patches.back());
}

TEST(AlignmentExtractorTest, UnhashableSetElement) {
  EXPECT_THAT(Extract(L({Set({L({I(1)})})}), L({})),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unhashable set element")));
}

TEST(AlignmentExtractorTest, NotApplicable) {
  EXPECT_THAT(Extract(L({}), M({})), StatusIs(absl::StatusCode::kInternal));
}

}  // namespace
}  // namespace structdiff
