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


#include "structdiff/base/lcs_test_util.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "structdiff/base/lcs.h"

namespace structdiff_base {
namespace internal {

bool Equals(const Chunk& chunk, int left, int right, int len) {
  return chunk.left == left && chunk.right == right && chunk.length == len;
}

int RunSimpleLcs(const std::vector<int>& left, const std::vector<int>& right) {
  std::vector<int> prev_col(right.size() + 1, 0);
  std::vector<int> curr_col(right.size() + 1, 0);
  for (int x = 1; x <= left.size(); x++) {
    for (int y = 1; y <= right.size(); y++) {
      if (left[x - 1] == right[y - 1])
        curr_col[y] = prev_col[y - 1] + 1;
      else
        curr_col[y] = std::max(prev_col[y], curr_col[y - 1]);
    }
    using std::swap;
    swap(prev_col, curr_col);
  }
  return prev_col.back();
}

std::vector<int> RandomSequence(absl::BitGenRef rand, int n, int min_item,
                                int max_item) {
  std::vector<int> output;
  output.reserve(n);
  while (n-- > 0)
    output.push_back(absl::Uniform<int>(absl::IntervalClosed, rand, min_item,
                                        max_item));
  return output;
}

void VerifyChunks(const std::vector<int>& left, const std::vector<int>& right,
                  const std::vector<Chunk>& chunks, int expected_lcs) {
  const std::string context =
      absl::StrCat("[", absl::StrJoin(left, ","), "] vs [",
                   absl::StrJoin(right, ","), "]");
  int lcs = 0;
  for (int i = 0; i < chunks.size(); i++) {
    const Chunk& current = chunks[i];
    EXPECT_LT(0, current.length) << "Empty chunk in " << context;
    EXPECT_LE(current.left + current.length, left.size()) << context;
    EXPECT_LE(current.right + current.length, right.size()) << context;
    if (i > 0) {
      const Chunk& previous = chunks[i - 1];
      EXPECT_LE(previous.left + previous.length, current.left)
          << "Overlapping chunk for the left side in " << context;
      EXPECT_LE(previous.right + previous.length, current.right)
          << "Overlapping chunk for the right side in " << context;
      EXPECT_FALSE(previous.left + previous.length == current.left &&
                   previous.right + previous.length == current.right)
          << "Chunks have not been merged in " << context;
    }
    for (int k = 0; k < current.length; k++) {
      if (current.left + k >= left.size() ||
          current.right + k >= right.size())
        break;
      EXPECT_EQ(left[current.left + k], right[current.right + k])
          << "Chunk has different content on left and right side in "
          << context;
    }
    lcs += current.length;
  }
  EXPECT_EQ(expected_lcs, lcs) << context;
}

}  // namespace internal
}  // namespace structdiff_base
