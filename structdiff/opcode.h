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


// Edit scripts computed from an LCS alignment of two integer sequences.
#ifndef STRUCTDIFF_OPCODE_H_
#define STRUCTDIFF_OPCODE_H_

#include <ostream>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/lcs.h"

namespace structdiff {

// Each opcode is described by a type, a "source region"
// [source_first, source_last) of the first sequence and a "target region"
// [target_first, target_last) of the second one.
//
// UNCHANGED:          The source region equals the target region. It is
//                     guaranteed that the regions have equal length.
// ADDED:              Insert a copy of the target region at position
//                     source_first. The source region is empty.
// REMOVED:            Delete the source region. The target region is empty.
// CHANGED:            Replace the source region with the target region. Both
//                     are non-empty, but their lengths may differ.
//
// Consecutive opcodes cover both sequences without gaps or overlaps.
enum OpcodeType { UNCHANGED, ADDED, REMOVED, CHANGED };

struct Opcode {
  Opcode() {}
  Opcode(OpcodeType t, int s_first, int s_last, int t_first, int t_last)
      : source_first(s_first),
        source_last(s_last),
        target_first(t_first),
        target_last(t_last),
        type(t) {}

  int source_length() const { return source_last - source_first; }
  int target_length() const { return target_last - target_first; }

  int source_first = 0;
  int source_last = 0;
  int target_first = 0;
  int target_last = 0;

  OpcodeType type = UNCHANGED;

  // "equal", "insert", "delete" or "replace".
  absl::string_view name() const { return name(type); }
  static absl::string_view name(OpcodeType type);

  std::string DebugString() const;
};

bool operator==(const Opcode& a, const Opcode& b);
std::ostream& operator<<(std::ostream& os, const Opcode& opcode);

// Converts ordered, merged LCS chunks of sequences with the given sizes into
// opcodes. Unmatched stretches between two chunks become ADDED, REMOVED or,
// when both sides are non-empty, CHANGED.
std::vector<Opcode> ChunksToOpcodes(
    const std::vector<structdiff_base::Chunk>& chunks, int left_size,
    int right_size);

// Aligns the two sequences and returns their edit script. Fails with
// ResourceExhausted if options.strict_memory_limit() is set and the alignment
// does not fit into options.max_memory().
absl::StatusOr<std::vector<Opcode>> ComputeOpcodes(
    const std::vector<int>& left, const std::vector<int>& right,
    const structdiff_base::LcsOptions& options);

}  // namespace structdiff

#endif  // STRUCTDIFF_OPCODE_H_
