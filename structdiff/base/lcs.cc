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


#include "structdiff/base/lcs.h"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "structdiff/base/lcs_myers.h"
#include "structdiff/base/lcs_util.h"
#include "structdiff/base/logging.h"

namespace structdiff_base {

void Lcs::set_options(const LcsOptions& options) {
  options_ = options;
}

LcsOptions* Lcs::mutable_options() {
  return &options_;
}

int Lcs::Run(const std::vector<int>& left, const std::vector<int>& right,
             std::vector<Chunk>* chunks) {
  return Run(left.data(), left.size(), right.data(), right.size(), chunks);
}

int Lcs::Run(const int* left, int left_size, const int* right, int right_size,
             std::vector<Chunk>* chunks) {
  const int first_chunk = chunks == nullptr ? 0 : chunks->size();
  const int lcs =
      RunWithOffsets(left, left_size, 0, right, right_size, 0, chunks);
  if (lcs < 0 && chunks != nullptr)
    chunks->erase(chunks->begin() + first_chunk, chunks->end());
  return lcs;
}

int Lcs::RunWithOffsets(const int* left, int left_size, int left_offset,
                        const int* right, int right_size, int right_offset,
                        std::vector<Chunk>* chunks) {
  // Consume leading matches.
  int leading_matches = 0;
  while (leading_matches < std::min(left_size, right_size) &&
         left[leading_matches] == right[leading_matches])
    leading_matches++;
  left_size -= leading_matches;
  right_size -= leading_matches;
  left += leading_matches;
  right += leading_matches;

  if (leading_matches && chunks)
    AppendChunk(left_offset, right_offset, leading_matches, chunks);
  left_offset += leading_matches;
  right_offset += leading_matches;

  // Consume trailing matches.
  int trailing_matches = 0;
  while (std::min(left_size, right_size) > 0 &&
         left[left_size - 1] == right[right_size - 1]) {
    trailing_matches++;
    left_size--;
    right_size--;
  }

  const int lcs = RunTrimmed(left, left_size, left_offset,
                             right, right_size, right_offset, chunks);
  if (lcs < 0)
    return lcs;

  if (trailing_matches && chunks)
    AppendChunk(left_offset + left_size, right_offset + right_size,
                trailing_matches, chunks);

  return lcs + leading_matches + trailing_matches;
}

int Lcs::RunTrimmed(const int* left, int left_size, int left_offset,
                    const int* right, int right_size, int right_offset,
                    std::vector<Chunk>* chunks) {
  if (left_size == 0 || right_size == 0)
    return 0;

  const int64_t max_memory = options_.max_memory();
  std::vector<Chunk>* chunks_arg = chunks;
  if (chunks != nullptr &&
      internal::MyersBackpointerMemory(left_size + right_size) > max_memory) {
    // Keeping all backpointers would exceed the memory limit. Compute only a
    // split point and recurse on both halves instead.
    chunks_arg = nullptr;
  }
  if (options_.strict_memory_limit() &&
      internal::MyersSplitMemory(left_size, right_size) > max_memory)
    return kLcsMemoryLimitExceeded;

  internal::LcsMyers myers;
  const int lcs = myers.Run(left, left_size, left_offset, right, right_size,
                            right_offset, chunks_arg);
  if (chunks_arg != chunks && lcs > 0) {
    const int split_x = myers.split_x();
    const int split_y = myers.split_y();
    const int a = RunWithOffsets(left, split_x, left_offset, right, split_y,
                                 right_offset, chunks);
    if (a < 0)
      return a;
    const int b = RunWithOffsets(left + split_x, left_size - split_x,
                                 left_offset + split_x, right + split_y,
                                 right_size - split_y, right_offset + split_y,
                                 chunks);
    if (b < 0)
      return b;
    STRUCTDIFF_DCHECK_EQ(a + b, lcs);
  }
  return lcs;
}

}  // namespace structdiff_base
