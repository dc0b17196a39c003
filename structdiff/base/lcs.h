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

// API for Longest Common Subsequence computations.
// Note: Don't mistake it for Longest Common Substring!
//
// The alignment extractor uses it as follows:
//
//   std::vector<CanonicalValue> left, right;
//   ... // Canonicalize the elements of both sequences.
//
//   std::vector<int> left_int, right_int;
//   // Convert the canonical values into integer representation.
//   Lcs::MapToInteger<CanonicalValue>(left, right, &left_int, &right_int);
//   Lcs lcs;
//   lcs.mutable_options()->set_max_memory(budget);
//   std::vector<Chunk> chunks;
//   int len = lcs.Run(left_int, right_int, &chunks);
//   if (len < 0) ... // See LcsErrorCodes.
//
// The MapToInteger function keeps the templates out of the Lcs API: any
// hashable item type can be reduced to a vector<int> before running the
// algorithm.
#ifndef STRUCTDIFF_BASE_LCS_H_
#define STRUCTDIFF_BASE_LCS_H_

#include <cstdint>
#include <limits>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace structdiff_base {

// Since LCS have always a non-negative length, negative values are used for
// expressing errors.
enum LcsErrorCodes {
  kLcsMemoryLimitExceeded = -1,
};

// Configuration of the Lcs algorithm is done via LcsOptions.
class LcsOptions {
 public:
  LcsOptions();

  // Determine the maximum amount of memory which should be allocated by the
  // LCS instance. If the memory is not sufficient for computing LCS, Run()
  // returns kLcsMemoryLimitExceeded and no matches will be reported.
  // Internally, the algorithm switches between a backpointer and a recursive
  // implementation. The latter consumes only a linear amount of memory but has
  // a higher constant than the former, which consumes a quadratic amount of
  // memory in the worst case.
  int max_memory() const { return max_memory_; }
  void set_max_memory(int max_memory) { max_memory_ = max_memory; }

  // If false, max_memory() only chooses between the backpointer and the
  // recursive implementation: Run() never fails and uses the recursive one,
  // with its linear memory, whenever the backpointers do not fit.
  bool strict_memory_limit() const { return strict_memory_limit_; }
  void set_strict_memory_limit(bool strict) { strict_memory_limit_ = strict; }

 private:
  int max_memory_;
  bool strict_memory_limit_;
};

// Representation of a chunk which occurs in two sequences.
struct Chunk {
  Chunk(int l, int r, int len)
      : left(l), right(r), length(len) {
  }

  int left;    // First common item in the left sequence.
  int right;   // First common item in the right sequence.
  int length;  // Number of identical items in both sequences.
};

class Lcs {
 public:
  void set_options(const LcsOptions& options);
  LcsOptions* mutable_options();

  // Computes the longest common subsequence between the two integer sequences.
  // The return value represents the length of the longest common subsequence.
  // The actual common sequence is represented by the chunks vector where each
  // chunk represents contiguous matches ordered by ascending positions.
  // Adjacent chunks are always merged. If one is only interested in the
  // length of the longest common subsequence, chunks may be nullptr.
  //
  // If the LCS computation has to be aborted due to the memory limit, it
  // returns a negative value (see LcsErrorCodes); chunks appended so far must
  // then be discarded.
  int Run(const std::vector<int>& left,
          const std::vector<int>& right,
          std::vector<Chunk>* chunks);

  // Same as above.
  int Run(const int* left, int left_size, const int* right, int right_size,
          std::vector<Chunk>* chunks);

  // Returns the number of different integers generated by the mapping.
  // Only non-negative integers smaller than this value occur in the mapping.
  // Two entries of the mapped containers (left_int and right_int) are equal
  // if the corresponding entries of the original containers (left and right)
  // are equal. Entries which occur only on one side are mapped to the same
  // integer such that the minimal number of distinct integers is generated.
  // Entries which are not equal to themselves (e.g. NaN) never match.
  template <class ValueType, class Container>
  static int MapToInteger(const Container& left,
                          const Container& right,
                          std::vector<int>* left_int,
                          std::vector<int>* right_int);

 private:
  // Runs on inputs without common prefix or suffix. Offsets are added to
  // every reported chunk.
  int RunTrimmed(const int* left, int left_size, int left_offset,
                 const int* right, int right_size, int right_offset,
                 std::vector<Chunk>* chunks);

  int RunWithOffsets(const int* left, int left_size, int left_offset,
                     const int* right, int right_size, int right_offset,
                     std::vector<Chunk>* chunks);

  LcsOptions options_;
};

template <class ValueType, class Container>
int Lcs::MapToInteger(const Container& left,
                      const Container& right,
                      std::vector<int>* left_int,
                      std::vector<int>* right_int) {
  absl::flat_hash_map<ValueType, int> hash;

  const int left_size = left.size();
  const int right_size = right.size();
  left_int->clear();
  right_int->clear();
  left_int->reserve(left_size);
  right_int->reserve(right_size);

  // Create integer values for the right side.
  bool has_sentinel = false;
  for (const auto& right_entry : right) {
    // flat_hash_map requires that the constructed key in the map is equal to
    // the insertion key. An entry that is not equal to itself can be
    // trivially left out of the map.
    if (!(right_entry == right_entry)) {
      has_sentinel = true;
      right_int->push_back(-1);
    } else {
      const int mapped =
          hash.try_emplace(right_entry, static_cast<int>(hash.size()))
              .first->second;
      right_int->push_back(mapped);
    }
  }

  // Map left side to the same integers as for the right side.
  // Values not occurring on the right side are mapped to a single integer.
  const int num_right_keys = hash.size();
  std::vector<int> used_by_left(num_right_keys + 1, 0);
  for (const auto& left_entry : left) {
    auto it = hash.find(left_entry);
    const int mapped = it == hash.end() ? num_right_keys : it->second;
    left_int->push_back(mapped);
    // Mark that mapped occurs on the left.
    used_by_left[mapped] = 1;
  }

  // Compact the range of integers by ignoring integers which occur only on the
  // right side. This is purely an optimization which reduces the memory
  // consumption of subsequent steps.
  // First, assign each integer a new value. Values not occurring on the left
  // are mapped to the integer value not_occurring.
  int num_new_keys = 0;
  int not_occurring = has_sentinel ? num_new_keys++ : -1;
  for (int k = 0; k <= num_right_keys; ++k) {
    if (used_by_left[k]) {
      used_by_left[k] = num_new_keys++;
    } else if (k < num_right_keys) {
      if (not_occurring == -1)
        not_occurring = num_new_keys++;
      used_by_left[k] = not_occurring;
    }
  }
  // Second, update the already assigned integer values.
  for (int i = 0; i < left_size; ++i)
    (*left_int)[i] = used_by_left[(*left_int)[i]];
  for (int j = 0; j < right_size; ++j) {
    int& ri = (*right_int)[j];
    if (ri == -1) {
      ri = not_occurring;
    } else {
      ri = used_by_left[ri];
    }
  }
  return num_new_keys;
}

}  // namespace structdiff_base

#endif  // STRUCTDIFF_BASE_LCS_H_
