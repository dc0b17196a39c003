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


#ifndef STRUCTDIFF_BASE_LCS_MYERS_H_
#define STRUCTDIFF_BASE_LCS_MYERS_H_

#include <deque>
#include <vector>

#include "structdiff/base/lcs.h"

namespace structdiff_base {
namespace internal {

// Implementation of Myers' algorithm (http://www.xmailserver.org/diff2.pdf)
// on integer sequences as produced by Lcs::MapToInteger.
// Its complexity is O((left_size + right_size) * D), where D is the difference
// between the two sequences. The computation of a split point together with
// the actual difference requires only O(D) <= O(left_size + right_size)
// memory. If the actual chunks should be computed in the same pass, the memory
// consumption increases to O(D * D). Embedding Myers' algorithm into a
// recursive scheme (see Lcs::Run), the chunks can be computed with linear
// memory overhead while keeping the overall runtime mentioned above.
class LcsMyers {
 public:
  // Runs Myers' algorithm on the two sequences. If chunks is not nullptr, the
  // matching chunks will be appended. Otherwise, only the difference and
  // a split point will be computed, which saves the quadratic backpointer
  // storage.
  // Returns the length of the longest common subsequence.
  int Run(const int* left, int left_size, int left_offset,
          const int* right, int right_size, int right_offset,
          std::vector<Chunk>* chunks);

  // The split point lies on an optimal path through the edit graph. Only
  // valid after Run().
  int split_x() const { return split_x_; }
  int split_y() const { return split_y_; }

  // Number of mismatches of the last Run().
  int diff() const { return diff_; }

 private:
  // Computes the y coordinate for a given x coordinate and the forward
  // diagonal specified by k_fwd and D.
  static int ComputeYForward(int x, int k_fwd, int D) {
    return x - 2 * k_fwd + D;
  }

  // Computes the y coordinate for a given x coordinate and the reverse
  // diagonal specified by k_rev and D.
  static int ComputeYReverse(int x, int k_rev, int D, int left_size,
                             int right_size) {
    return right_size - left_size - D + x + 2 * k_rev;
  }

  // Transforms a forward diagonal into the corresponding reverse diagonal
  // (assuming that the reverse search has one mismatch less).
  static int ComputeKReverse(int k_fwd, int D, int left_size, int right_size) {
    return D - k_fwd - (right_size - left_size + 1) / 2;
  }

  // Transforms a reverse diagonal into the corresponding forward diagonal
  // (assuming that both searches have the same number of mismatches).
  static int ComputeKForward(int k_rev, int D, int left_size, int right_size) {
    return (left_size - right_size) / 2 - k_rev + D;
  }

  void SaveSplitPoint(int k_fwd, int k_rev, int x, int diff);

  template <bool kOddDelta, bool kSaveBackpointers>
  void Search(const int* left, int left_size, const int* right,
              int right_size);

  // Reports the chunks by following the stored backpointers from the split
  // point in forward and reverse direction.
  void Report(int left_size, int left_offset, int right_size, int right_offset,
              std::vector<Chunk>* chunks) const;

  // Backpointers of both searches. Each entry encodes the preceding x
  // position times two plus one bit for the side of the mismatch.
  std::deque<int> preceding_x_fwd_;
  std::deque<int> preceding_x_rev_;
  int split_x_ = 0;
  int split_y_ = 0;
  int split_k_fwd_ = 0;
  int split_k_rev_ = 0;
  int diff_ = 0;
};

}  // namespace internal
}  // namespace structdiff_base

#endif  // STRUCTDIFF_BASE_LCS_MYERS_H_
