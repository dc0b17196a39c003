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


// Generic test functions for the LCS engine on integer sequences.
#ifndef STRUCTDIFF_BASE_LCS_TEST_UTIL_H_
#define STRUCTDIFF_BASE_LCS_TEST_UTIL_H_

#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "structdiff/base/lcs.h"

namespace structdiff_base {
namespace internal {

// Checks whether a Chunk is set to the specified parameters.
bool Equals(const Chunk& chunk, int left, int right, int len);

// Computes LCS with the straight-forward dynamic programming scheme. It
// consumes O(right.size()) memory and runs in O(left.size() * right.size())
// time.
int RunSimpleLcs(const std::vector<int>& left, const std::vector<int>& right);

// Returns a random sequence of length n whose items are in the range
// [min_item, max_item].
std::vector<int> RandomSequence(absl::BitGenRef rand, int n, int min_item,
                                int max_item);

// Verifies whether the passed chunks are sorted and merged, reference
// identical items in both sequences, and describe a subsequence of the
// expected length.
void VerifyChunks(const std::vector<int>& left, const std::vector<int>& right,
                  const std::vector<Chunk>& chunks, int expected_lcs);

}  // namespace internal
}  // namespace structdiff_base

#endif  // STRUCTDIFF_BASE_LCS_TEST_UTIL_H_
