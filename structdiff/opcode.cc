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


#include "structdiff/opcode.h"

#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "structdiff/base/lcs.h"
#include "structdiff/base/logging.h"
#include "structdiff/base/ret_check.h"
#include "structdiff/base/status_builder.h"

namespace structdiff {
namespace {

constexpr absl::string_view kOpcodeNames[] = {"equal", "insert", "delete",
                                              "replace"};

void AppendGap(int source_first, int source_last, int target_first,
               int target_last, std::vector<Opcode>* opcodes) {
  const bool source_gap = source_first < source_last;
  const bool target_gap = target_first < target_last;
  if (!source_gap && !target_gap) return;
  OpcodeType type = CHANGED;
  if (!source_gap) {
    type = ADDED;
  } else if (!target_gap) {
    type = REMOVED;
  }
  opcodes->emplace_back(type, source_first, source_last, target_first,
                        target_last);
}

bool ShareAnItem(const std::vector<int>& left, const std::vector<int>& right) {
  const absl::flat_hash_set<int> left_items(left.begin(), left.end());
  for (int item : right) {
    if (left_items.contains(item)) return true;
  }
  return false;
}

}  // namespace

absl::string_view Opcode::name(OpcodeType type) {
  if (type > CHANGED || type < UNCHANGED) {
    STRUCTDIFF_LOG(WARNING) << "Invalid opcode type " << static_cast<int>(type);
    return "???";
  }
  return kOpcodeNames[type];
}

std::string Opcode::DebugString() const {
  return absl::StrCat(name(), " [", source_first, ",", source_last, ") [",
                      target_first, ",", target_last, ")");
}

bool operator==(const Opcode& a, const Opcode& b) {
  return a.type == b.type && a.source_first == b.source_first &&
         a.source_last == b.source_last && a.target_first == b.target_first &&
         a.target_last == b.target_last;
}

std::ostream& operator<<(std::ostream& os, const Opcode& opcode) {
  return os << opcode.DebugString();
}

std::vector<Opcode> ChunksToOpcodes(
    const std::vector<structdiff_base::Chunk>& chunks, int left_size,
    int right_size) {
  std::vector<Opcode> opcodes;
  int left = 0;
  int right = 0;
  for (const structdiff_base::Chunk& chunk : chunks) {
    AppendGap(left, chunk.left, right, chunk.right, &opcodes);
    opcodes.emplace_back(UNCHANGED, chunk.left, chunk.left + chunk.length,
                         chunk.right, chunk.right + chunk.length);
    left = chunk.left + chunk.length;
    right = chunk.right + chunk.length;
  }
  AppendGap(left, left_size, right, right_size, &opcodes);
  return opcodes;
}

absl::StatusOr<std::vector<Opcode>> ComputeOpcodes(
    const std::vector<int>& left, const std::vector<int>& right,
    const structdiff_base::LcsOptions& options) {
  // Without a common item the sequences align as one replaced run.
  if (!ShareAnItem(left, right)) {
    return ChunksToOpcodes({}, left.size(), right.size());
  }

  structdiff_base::Lcs lcs;
  *lcs.mutable_options() = options;
  std::vector<structdiff_base::Chunk> chunks;
  const int length = lcs.Run(left, right, &chunks);
  if (length == structdiff_base::kLcsMemoryLimitExceeded) {
    return structdiff_base::ResourceExhaustedErrorBuilder()
           << "aligning sequences of length " << left.size() << " and "
           << right.size() << " exceeds the memory limit of "
           << options.max_memory() << " bytes";
  }
  STRUCTDIFF_RET_CHECK_GE(length, 0);

  std::vector<Opcode> opcodes =
      ChunksToOpcodes(chunks, left.size(), right.size());
  int source = 0;
  int target = 0;
  for (const Opcode& opcode : opcodes) {
    STRUCTDIFF_RET_CHECK_EQ(opcode.source_first, source) << opcode;
    STRUCTDIFF_RET_CHECK_EQ(opcode.target_first, target) << opcode;
    source = opcode.source_last;
    target = opcode.target_last;
  }
  STRUCTDIFF_RET_CHECK_EQ(source, left.size());
  STRUCTDIFF_RET_CHECK_EQ(target, right.size());
  return opcodes;
}

}  // namespace structdiff
