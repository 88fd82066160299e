// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.

#ifndef QSXFER_CLIENT_CHUNKPLANNER_H_
#define QSXFER_CLIENT_CHUNKPLANNER_H_

#include <limits.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace QSX {

namespace Client {

// A contiguous byte span of an object, transferred as one unit
struct ChunkRange {
  ChunkRange() : index(0), offset(0), length(0) {}
  ChunkRange(uint32_t idx, uint64_t off, uint64_t len)
      : index(idx), offset(off), length(len) {}

  // 1-based ordinal used by the multipart protocol
  int GetPartNumber() const { return static_cast<int>(index) + 1; }
  std::string ToString() const;

  uint32_t index;  // 0-based
  uint64_t offset;
  uint64_t length;
};

// Part numbers are ints, which bounds the chunks of one transfer
static const uint64_t MaxChunkCount = INT_MAX;

typedef std::vector<ChunkRange> ChunkRangeList;
typedef Outcome<ChunkRangeList, TransferClientError> ChunkPlanOutcome;

// Number of chunks needed to cover totalSize, chunkSize must not be 0
uint64_t CountChunks(uint64_t totalSize, uint64_t chunkSize);

// Plan chunks
//
// @param  : total size, chunk size, max number of chunks
// @return : ChunkPlanOutcome
//
// The ranges partition [0, totalSize) in ascending index order, only the
// last one may be shorter than chunkSize. Fail with EMPTY_OBJECT when
// totalSize is 0, with TOO_MANY_CHUNKS when more than maxChunks are needed or
// when chunkSize is 0. A maxChunks above MaxChunkCount is lowered to it.
ChunkPlanOutcome PlanChunks(uint64_t totalSize, uint64_t chunkSize,
                            uint64_t maxChunks);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_CHUNKPLANNER_H_
