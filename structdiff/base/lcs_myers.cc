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

#include <algorithm>
#include <vector>

#include "structdiff/base/lcs.h"
#include "structdiff/base/lcs_util.h"
#include "structdiff/base/logging.h"

namespace structdiff_base {
namespace internal {

int LcsMyers::Run(const int* left, int left_size, int left_offset,
                  const int* right, int right_size, int right_offset,
                  std::vector<Chunk>* chunks) {
  const bool odd_delta = (left_size - right_size) & 1;
  if (odd_delta) {
    if (chunks != nullptr) {
      Search<true, true>(left, left_size, right, right_size);
    } else {
      Search<true, false>(left, left_size, right, right_size);
    }
  } else {
    if (chunks != nullptr) {
      Search<false, true>(left, left_size, right, right_size);
    } else {
      Search<false, false>(left, left_size, right, right_size);
    }
  }
  if (chunks != nullptr)
    Report(left_size, left_offset, right_size, right_offset, chunks);
  return (left_size + right_size - diff_) / 2;
}

// Two shortest-path searches run in parallel. The one starting from (0,0) is
// called forward search, the other starting from (left_size, right_size) is
// called reverse search. The loop stops as soon as both searches overlap,
// which is guaranteed to happen for D <= (left_size + right_size + 1) / 2.
template <bool kOddDelta, bool kSaveBackpointers>
void LcsMyers::Search(const int* left, int left_size, const int* right,
                      int right_size) {
  const int k_max = (left_size + right_size + 1) / 2;
  std::vector<int> best_x_fwd(k_max + 1);
  std::vector<int> best_x_rev(k_max + 1);
  if (kSaveBackpointers) {
    preceding_x_fwd_.clear();
    preceding_x_rev_.clear();
  }
  for (int D = 0; D <= k_max; D++) {
    // Append one mismatch to the forward paths of the previous round and
    // follow as many matches as possible. prev and best_x_fwd[D] must never
    // be chosen as backreference (except for D = 0).
    int prev = -1;
    best_x_fwd[D] = 0;
    for (int k_fwd = 0; k_fwd <= D; k_fwd++) {
      const int next = best_x_fwd[k_fwd];
      if (kSaveBackpointers)
        preceding_x_fwd_.push_back(prev < next ? next * 2 : prev * 2 + 1);
      int x = std::max(prev, next);
      int y = ComputeYForward(x, k_fwd, D);
      prev = next + 1;
      while (x < left_size && y < right_size && left[x] == right[y]) {
        ++x;
        ++y;
      }
      best_x_fwd[k_fwd] = x;
      const int k_rev = ComputeKReverse(k_fwd, D, left_size, right_size);
      if (kOddDelta && k_rev >= 0 && k_rev < D && best_x_rev[k_rev] <= x) {
        SaveSplitPoint(k_fwd, k_rev, x, D * 2 - 1);
        return;
      }
    }
    // Same for the reverse paths.
    best_x_rev[D] = left_size;
    prev = left_size;
    for (int k_rev = 0; k_rev <= D; k_rev++) {
      const int next = best_x_rev[k_rev];
      if (kSaveBackpointers)
        preceding_x_rev_.push_back(prev >= next ? next * 2 : prev * 2 + 1);
      int x = std::min(prev, next);
      int y = ComputeYReverse(x, k_rev, D, left_size, right_size);
      prev = next - 1;
      while (x > 0 && y > 0 && left[x - 1] == right[y - 1]) {
        --x;
        --y;
      }
      best_x_rev[k_rev] = x;
      const int k_fwd = ComputeKForward(k_rev, D, left_size, right_size);
      if (!kOddDelta && k_fwd >= 0 && k_fwd <= D && x <= best_x_fwd[k_fwd]) {
        SaveSplitPoint(k_fwd, k_rev, best_x_fwd[k_fwd], D * 2);
        return;
      }
    }
  }
  STRUCTDIFF_LOG(FATAL) << "Myers search did not converge for sizes "
                        << left_size << " and " << right_size;
}

void LcsMyers::SaveSplitPoint(int k_fwd, int k_rev, int x, int diff) {
  diff_ = diff;
  split_k_fwd_ = k_fwd;
  split_k_rev_ = k_rev;
  split_x_ = x;
  split_y_ = ComputeYForward(x, k_fwd, (diff + 1) / 2);
}

void LcsMyers::Report(int left_size, int left_offset, int right_size,
                      int right_offset, std::vector<Chunk>* chunks) const {
  // Chunks before the split point come from the backpointers of the forward
  // search. They are collected in reverse order.
  int D = (diff_ + 1) / 2;
  int k_fwd = split_k_fwd_;
  int x = split_x_;
  const int first_chunk = chunks->size();
  for (; D >= 0; --D) {
    const int bp = preceding_x_fwd_[(D + 1) * D / 2 + k_fwd];
    const int len = x - bp / 2;
    x -= len;
    const int y = ComputeYForward(x, k_fwd, D);
    AppendReverseChunk(x + left_offset, y + right_offset, len, chunks);
    if (bp & 1) {
      x--;
      k_fwd--;
    }
  }
  ReorderReverseChunks(first_chunk, chunks);

  // Chunks after the split point come from the reverse search. Matches
  // before the split point were already reported above.
  D = diff_ / 2;
  int k_rev = split_k_rev_;
  x = split_x_;
  for (; D >= 0; --D) {
    const int bp = preceding_x_rev_[D * (D + 1) / 2 + k_rev];
    const int len = bp / 2 - x;
    const int y = ComputeYReverse(x, k_rev, D, left_size, right_size);
    // A negative len is possible during the first iteration.
    const int skip =
        std::min(len, std::max(0, std::max(split_x_ - x, split_y_ - y)));
    AppendChunk(x + skip + left_offset, y + skip + right_offset, len - skip,
                chunks);
    x += len;
    if (bp & 1) {
      x++;
      k_rev--;
    }
  }
}

}  // namespace internal
}  // namespace structdiff_base
