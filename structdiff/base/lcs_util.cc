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


#include "structdiff/base/lcs_util.h"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "structdiff/base/lcs.h"

namespace structdiff_base {

LcsOptions::LcsOptions()
    : max_memory_(1 << 20),  // 1 MB should be sufficient for most cases.
      strict_memory_limit_(true) {}

bool CanBeMerged(const Chunk& before, const Chunk& after) {
  return before.left + before.length == after.left &&
      before.right + before.length == after.right;
}

void AppendChunk(int left, int right, int len, std::vector<Chunk>* chunks) {
  if (len == 0)
    return;
  if (!chunks->empty() &&
      CanBeMerged(chunks->back(), Chunk(left, right, len))) {
    chunks->back().length += len;
    return;
  }
  chunks->emplace_back(left, right, len);
}

void AppendReverseChunk(int left, int right, int len,
                        std::vector<Chunk>* chunks) {
  if (len == 0)
    return;
  if (!chunks->empty() &&
      CanBeMerged(Chunk(left, right, len), chunks->back())) {
    Chunk& last = chunks->back();
    last.left = left;
    last.right = right;
    last.length += len;
    return;
  }
  chunks->emplace_back(left, right, len);
}

void ReorderReverseChunks(int first_chunk, std::vector<Chunk>* chunks) {
  if (first_chunk > 0 && first_chunk < chunks->size() &&
      CanBeMerged((*chunks)[first_chunk - 1], chunks->back())) {
    (*chunks)[first_chunk - 1].length += chunks->back().length;
    chunks->pop_back();
  }
  std::reverse(chunks->begin() + first_chunk, chunks->end());
}

namespace internal {

int64_t MyersBackpointerMemory(int64_t max_diff) {
  const int64_t k_max = (max_diff + 1) / 2;
  return (k_max + 2) * (k_max + 1) * static_cast<int64_t>(sizeof(int));
}

int64_t MyersSplitMemory(int64_t left_size, int64_t right_size) {
  return (2 + left_size + right_size) * static_cast<int64_t>(sizeof(int));
}

}  // namespace internal
}  // namespace structdiff_base
