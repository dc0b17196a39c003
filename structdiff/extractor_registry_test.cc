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

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "structdiff/base/status_matchers.h"
#include "structdiff/diff_driver.h"
#include "structdiff/extractor.h"
#include "structdiff/node_path.h"
#include "structdiff/patch.h"
#include "structdiff/test_util.h"

namespace structdiff {
namespace {

using ::structdiff_base::testing::IsOkAndHolds;
using ::structdiff_base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::Pair;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;
using testing::FlagSetter;
using testing::I;
using testing::L;
using testing::M;
using testing::N;
using testing::S;
using testing::Set;

MATCHER_P(IsExtractor, kind, "") {
  return arg != nullptr && arg->kind() == kind;
}

MATCHER_P2(IsPatch, action, path, "") {
  return arg.action == action && arg.old_path == path;
}

ExtractorUpdate AlignLists() {
  ExtractorUpdate update;
  update.by_kind[Value::kList] = ExtractorKind::kAlignment;
  return update;
}

Value Document() {
  return M({{S("name"), S("a")},
            {S("tags"), Set({I(1), I(2)})},
            {S("items"), L({I(1), L({I(2), I(3)}), M({{S("k"), I(1)}})})},
            {S("gone"), I(1)}});
}

Value EditedDocument() {
  return M({{S("name"), S("b")},
            {S("tags"), Set({I(2), I(3)})},
            {S("items"), L({I(0), I(1), L({I(2), I(4)}),
                            M({{S("k"), I(2)}}), I(5)})},
            {S("new"), L({N()})}});
}

// Records what the registry hands to the driver.
class RecordingDriver : public DiffDriver {
 public:
  absl::StatusOr<std::vector<Patch>> Drive(
      const Value& first, const Value& second, const ExtractorTable& table,
      const DriveOptions& options) const override {
    last_table = &table;
    last_options = options;
    return std::vector<Patch>();
  }

  mutable const ExtractorTable* last_table = nullptr;
  mutable DriveOptions last_options;
};

TEST(ExtractorRegistryTest, DefaultTable) {
  const ExtractorRegistry registry;
  EXPECT_THAT(registry.FindExact(Value::kMap),
              IsExtractor(ExtractorKind::kMap));
  EXPECT_THAT(registry.FindExact(Value::kList),
              IsExtractor(ExtractorKind::kPositional));
  EXPECT_THAT(registry.FindExact(Value::kSet),
              IsExtractor(ExtractorKind::kUnordered));
  EXPECT_EQ(nullptr, registry.FindExact(Value::kString));
  EXPECT_THAT(registry.fallback(),
              ElementsAre(IsExtractor(ExtractorKind::kMap),
                          IsExtractor(ExtractorKind::kPositional),
                          IsExtractor(ExtractorKind::kUnordered)));
}

TEST(ExtractorRegistryTest, DefaultExtractors) {
  const ExtractorUpdate defaults = DefaultExtractors();
  EXPECT_THAT(defaults.by_kind,
              UnorderedElementsAre(
                  Pair(Value::kMap, ExtractorKind::kMap),
                  Pair(Value::kList, ExtractorKind::kPositional),
                  Pair(Value::kSet, ExtractorKind::kUnordered)));
  EXPECT_THAT(defaults.fallback,
              Optional(ElementsAre(ExtractorKind::kMap,
                                   ExtractorKind::kPositional,
                                   ExtractorKind::kUnordered)));

  // Applying the defaults as an update changes nothing.
  const ExtractorRegistry registry(defaults);
  EXPECT_THAT(registry.FindExact(Value::kList),
              IsExtractor(ExtractorKind::kPositional));
  EXPECT_EQ(nullptr, registry.FindExact(Value::kString));
  EXPECT_THAT(registry.fallback(),
              ElementsAre(IsExtractor(ExtractorKind::kMap),
                          IsExtractor(ExtractorKind::kPositional),
                          IsExtractor(ExtractorKind::kUnordered)));
}

TEST(ExtractorRegistryTest, DefaultOptions) {
  const ExtractorRegistry registry;
  EXPECT_TRUE(registry.options().ignore().empty());
  EXPECT_TRUE(registry.options().try_default());
  EXPECT_FALSE(registry.options().expand());
  EXPECT_FALSE(registry.options().path_limit().IsLimit({}));
}

TEST(ExtractorRegistryTest, UpdateReplacesEntries) {
  ExtractorUpdate update = AlignLists();
  update.by_kind[Value::kString] = ExtractorKind::kMap;
  const ExtractorRegistry registry(update);
  EXPECT_THAT(registry.FindExact(Value::kList),
              IsExtractor(ExtractorKind::kAlignment));
  EXPECT_THAT(registry.FindExact(Value::kMap),
              IsExtractor(ExtractorKind::kMap));
  EXPECT_THAT(registry.FindExact(Value::kString),
              IsExtractor(ExtractorKind::kMap));
  EXPECT_THAT(registry.fallback(), SizeIs(3));
}

TEST(ExtractorRegistryTest, UpdateReplacesFallback) {
  ExtractorUpdate update;
  update.fallback = std::vector<ExtractorKind>{ExtractorKind::kAlignment};
  const ExtractorRegistry registry(update);
  EXPECT_THAT(registry.fallback(),
              ElementsAre(IsExtractor(ExtractorKind::kAlignment)));

  update.fallback = std::vector<ExtractorKind>();
  EXPECT_THAT(ExtractorRegistry(update).fallback(), IsEmpty());
}

TEST(ExtractorRegistryTest, MapScenario) {
  const ExtractorRegistry registry;
  EXPECT_THAT(
      registry.Extract(M({{S("a"), I(1)}, {S("b"), I(2)}}),
                       M({{S("b"), I(3)}, {S("c"), I(4)}})),
      IsOkAndHolds(ElementsAre(IsPatch(PatchAction::kDelete, Path{S("a")}),
                               IsPatch(PatchAction::kChange, Path{S("b")}),
                               IsPatch(PatchAction::kInsert, Path{S("c")}))));
}

TEST(ExtractorRegistryTest, PositionalScenario) {
  const ExtractorRegistry registry;
  // Equal elements are dropped; the rest of the patches recurse.
  EXPECT_THAT(
      registry.Extract(L({I(1), I(2), I(3)}), L({I(1), I(9)})),
      IsOkAndHolds(ElementsAre(IsPatch(PatchAction::kChange, Path{I(1)}),
                               IsPatch(PatchAction::kDelete, Path{I(2)}))));
}

TEST(ExtractorRegistryTest, AlignmentScenario) {
  const ExtractorRegistry registry(AlignLists());
  EXPECT_THAT(
      registry.Extract(L({I(1), I(2), I(3), I(4)}),
                       L({I(1), I(3), I(4), I(5)})),
      IsOkAndHolds(ElementsAre(IsPatch(PatchAction::kDelete, Path{I(1)}),
                               IsPatch(PatchAction::kInsert, Path{I(3)}))));
}

TEST(ExtractorRegistryTest, IdenticalValuesYieldNothing) {
  const ExtractorRegistry positional;
  const ExtractorRegistry aligned(AlignLists());
  for (const Value& value :
       {Document(), EditedDocument(), L({}), I(3), Set({S("x")})}) {
    EXPECT_THAT(positional.Extract(value, value), IsOkAndHolds(IsEmpty()));
    EXPECT_THAT(aligned.Extract(value, value), IsOkAndHolds(IsEmpty()));
  }
}

TEST(ExtractorRegistryTest, PatchesReplay) {
  for (bool expand : {false, true}) {
    ExtractionOptions options;
    options.set_expand(expand);
    const ExtractorRegistry positional(ExtractorUpdate(), options);
    const ExtractorRegistry aligned(AlignLists(), options);
    for (const ExtractorRegistry* registry : {&positional, &aligned}) {
      STRUCTDIFF_ASSERT_OK_AND_ASSIGN(
          std::vector<Patch> patches,
          registry->Extract(Document(), EditedDocument()));
      EXPECT_THAT(testing::ApplyPatches(Document(), patches),
                  IsOkAndHolds(EditedDocument()));
    }
  }
}

TEST(ExtractorRegistryTest, RandomNestedListsReplay) {
  const ExtractorRegistry registry(AlignLists());
  absl::BitGen gen;
  for (int i = 0; i < 100; ++i) {
    const Value first = M({{S("l"), testing::RandomList(
                                        gen, absl::Uniform<int>(gen, 0, 20),
                                        4)}});
    const Value second = M({{S("l"), testing::RandomList(
                                         gen, absl::Uniform<int>(gen, 0, 20),
                                         4)}});
    STRUCTDIFF_ASSERT_OK_AND_ASSIGN(std::vector<Patch> patches,
                                    registry.Extract(first, second));
    EXPECT_THAT(testing::ApplyPatches(first, patches), IsOkAndHolds(second))
        << first << " -> " << second;
  }
}

TEST(ExtractorRegistryTest, IgnoreSegments) {
  ExtractionOptions options;
  options.set_ignore(
      IgnoreSet::Segments(std::vector<Path>{{S("items"), I(0)}, {S("name")}}));
  const ExtractorRegistry registry(ExtractorUpdate(), options);
  EXPECT_THAT(registry.Extract(M({{S("name"), S("a")}, {S("n"), I(1)}}),
                               M({{S("name"), S("b")}, {S("n"), I(2)}})),
              IsOkAndHolds(ElementsAre(
                  IsPatch(PatchAction::kChange, Path{S("n")}))));
}

TEST(ExtractorRegistryTest, PathLimit) {
  ExtractionOptions options;
  PathLimit limit;
  limit.AddLimit({S("items")});
  options.set_path_limit(limit);
  const ExtractorRegistry registry(ExtractorUpdate(), options);
  STRUCTDIFF_ASSERT_OK_AND_ASSIGN(
      std::vector<Patch> patches,
      registry.Extract(Document(), EditedDocument()));
  int items = 0;
  for (const Patch& patch : patches) {
    if (!patch.old_path.empty() && patch.old_path[0] == S("items")) {
      ++items;
      EXPECT_EQ(Path{S("items")}, patch.old_path);
    }
  }
  EXPECT_EQ(1, items);
}

TEST(ExtractorRegistryTest, TryDefaultFlag) {
  FlagSetter try_default(&FLAGS_structdiff_try_default, false);
  EXPECT_FALSE(ExtractionOptions().try_default());

  ExtractorUpdate update;
  update.by_kind[Value::kSet] = ExtractorKind::kMap;
  const ExtractorRegistry registry(update);
  EXPECT_THAT(registry.Extract(Set({I(1)}), Set({I(2)})),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("no applicable extractor")));

  ExtractionOptions options;
  options.set_try_default(true);
  EXPECT_THAT(ExtractorRegistry(update, options)
                  .Extract(Set({I(1)}), Set({I(2)})),
              IsOkAndHolds(SizeIs(2)));
}

TEST(ExtractorRegistryTest, PassesItselfToTheDriver) {
  ExtractionOptions options;
  options.set_expand(true);
  options.set_try_default(false);
  RecordingDriver driver;
  const ExtractorRegistry registry(ExtractorUpdate(), options, &driver);
  EXPECT_THAT(registry.Extract(I(1), I(2)), IsOkAndHolds(IsEmpty()));
  EXPECT_EQ(&registry, driver.last_table);
  EXPECT_TRUE(driver.last_options.expand);
  EXPECT_FALSE(driver.last_options.try_default);
  EXPECT_EQ(&registry.options().ignore(), driver.last_options.ignore);
  EXPECT_EQ(&registry.options().path_limit(), driver.last_options.path_limit);
}

}  // namespace
}  // namespace structdiff
