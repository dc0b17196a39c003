//
// Copyright 2012 Google LLC
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


#include "structdiff/base/lcs_myers.h"

#include <vector>

#include "gtest/gtest.h"
#include "absl/random/random.h"
#include "structdiff/base/lcs.h"
#include "structdiff/base/lcs_test_util.h"

namespace structdiff_base {
namespace internal {

TEST(LcsMyers, Equal) {
  const std::vector<int> left = {0, 1, 0, 1, 1, 0, 0};
  std::vector<Chunk> chunks;
  LcsMyers myers;
  int lcs = myers.Run(left.data(), left.size(), 0, left.data(), left.size(), 0,
                      &chunks);
  EXPECT_EQ(7, lcs);
  EXPECT_EQ(0, myers.diff());
  ASSERT_EQ(1, chunks.size());
  EXPECT_TRUE(Equals(chunks[0], 0, 0, 7));
}

TEST(LcsMyers, DeletionOnRightSide) {
  const std::vector<int> left = {0, 1, 0, 1, 1, 0, 0};
  const std::vector<int> right = {0, 1, 0, 1, 0, 0};
  std::vector<Chunk> chunks;
  LcsMyers myers;
  int lcs = myers.Run(left.data(), left.size(), 0, right.data(), right.size(),
                      0, &chunks);
  EXPECT_EQ(6, lcs);
  EXPECT_EQ(1, myers.diff());
  ASSERT_EQ(2, chunks.size());
  EXPECT_TRUE(Equals(chunks[0], 0, 0, 4));
  EXPECT_TRUE(Equals(chunks[1], 5, 4, 2));
}

TEST(LcsMyers, DeletionOnLeftSide) {
  const std::vector<int> left = {0, 1, 1, 1, 0, 0};
  const std::vector<int> right = {0, 1, 0, 1, 1, 0, 0};
  std::vector<Chunk> chunks;
  LcsMyers myers;
  int lcs = myers.Run(left.data(), left.size(), 0, right.data(), right.size(),
                      0, &chunks);
  EXPECT_EQ(6, lcs);
  ASSERT_EQ(2, chunks.size());
  EXPECT_TRUE(Equals(chunks[0], 0, 0, 2));
  EXPECT_TRUE(Equals(chunks[1], 2, 3, 4));
}

TEST(LcsMyers, OffsetsAreAddedToChunks) {
  const std::vector<int> left = {5, 6, 7};
  const std::vector<int> right = {6, 7};
  std::vector<Chunk> chunks;
  LcsMyers myers;
  int lcs = myers.Run(left.data(), left.size(), 10, right.data(), right.size(),
                      20, &chunks);
  EXPECT_EQ(2, lcs);
  ASSERT_EQ(1, chunks.size());
  EXPECT_TRUE(Equals(chunks[0], 11, 20, 2));
}

TEST(LcsMyers, SplitPointWithoutChunks) {
  const std::vector<int> left = {1, 2, 3, 4, 5, 6};
  const std::vector<int> right = {1, 9, 3, 4, 9, 6};
  LcsMyers myers;
  int lcs = myers.Run(left.data(), left.size(), 0, right.data(), right.size(),
                      0, nullptr);
  EXPECT_EQ(4, lcs);
  EXPECT_LE(0, myers.split_x());
  EXPECT_LE(myers.split_x(), left.size());
  EXPECT_LE(0, myers.split_y());
  EXPECT_LE(myers.split_y(), right.size());
  // Both halves around the split point must add up to the total.
  int before = RunSimpleLcs(
      std::vector<int>(left.begin(), left.begin() + myers.split_x()),
      std::vector<int>(right.begin(), right.begin() + myers.split_y()));
  int after = RunSimpleLcs(
      std::vector<int>(left.begin() + myers.split_x(), left.end()),
      std::vector<int>(right.begin() + myers.split_y(), right.end()));
  EXPECT_EQ(lcs, before + after);
}

TEST(LcsMyers, RandomSequence) {
  absl::BitGen gen;
  LcsMyers myers;
  for (int k = 0; k < 1000; k++) {
    std::vector<int> left =
        RandomSequence(gen, absl::Uniform<int>(gen, 1, 100), 0, 1);
    std::vector<int> right =
        RandomSequence(gen, absl::Uniform<int>(gen, 1, 100), 0, 1);
    std::vector<Chunk> chunks;
    int expected = RunSimpleLcs(left, right);
    int lcs = myers.Run(left.data(), left.size(), 0, right.data(),
                        right.size(), 0, &chunks);
    EXPECT_EQ(expected, lcs);
    VerifyChunks(left, right, chunks, lcs);
  }
}

}  // namespace internal
}  // namespace structdiff_base
