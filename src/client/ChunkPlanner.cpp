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

#include "client/ChunkPlanner.h"

#include <stdint.h>

#include <string>

#include "boost/exception/to_string.hpp"

namespace QSX {

namespace Client {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string ChunkRange::ToString() const {
  return "[chunk:" + to_string(index) + ", offset:" + to_string(offset) +
         ", length:" + to_string(length) + "]";
}

// --------------------------------------------------------------------------
uint64_t CountChunks(uint64_t totalSize, uint64_t chunkSize) {
  return totalSize / chunkSize + (totalSize % chunkSize == 0 ? 0 : 1);
}

// --------------------------------------------------------------------------
ChunkPlanOutcome PlanChunks(uint64_t totalSize, uint64_t chunkSize,
                            uint64_t maxChunks) {
  if (totalSize == 0) {
    return ChunkPlanOutcome(TransferClientError(
        TransferError::EMPTY_OBJECT, "PlanChunks",
        "Nothing to transfer for an empty object", false));
  }
  if (chunkSize == 0) {
    return ChunkPlanOutcome(TransferClientError(
        TransferError::TOO_MANY_CHUNKS, "PlanChunks",
        "Chunk size must be positive", false));
  }

  if (maxChunks > MaxChunkCount) {
    maxChunks = MaxChunkCount;
  }
  uint64_t count = CountChunks(totalSize, chunkSize);
  if (count > maxChunks) {
    return ChunkPlanOutcome(TransferClientError(
        TransferError::TOO_MANY_CHUNKS, "PlanChunks",
        to_string(count) + " chunks of " + to_string(chunkSize) +
            " bytes exceed the maximum " + to_string(maxChunks) +
            ", raise the chunk size",
        false));
  }

  ChunkRangeList ranges;
  ranges.reserve(count);
  uint64_t offset = 0;
  for (uint64_t i = 0; i < count; ++i) {
    uint64_t length = i + 1 < count ? chunkSize : totalSize - offset;
    ranges.push_back(ChunkRange(static_cast<uint32_t>(i), offset, length));
    offset += length;
  }
  return ChunkPlanOutcome(ranges);
}

}  // namespace Client
}  // namespace QSX
