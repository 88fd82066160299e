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

#include <limits.h>
#include <stdint.h>

#include "gtest/gtest.h"

#include "base/Size.h"
#include "client/ChunkPlanner.h"

namespace QSX {

namespace Client {

using ::testing::Test;

void VerifyPartition(uint64_t totalSize, uint64_t chunkSize) {
  ChunkPlanOutcome plan = PlanChunks(totalSize, chunkSize, UINT64_MAX);
  ASSERT_TRUE(plan.IsSuccess()) << totalSize << "/" << chunkSize;

  const ChunkRangeList &ranges = plan.GetResult();
  uint64_t expectedCount = (totalSize + chunkSize - 1) / chunkSize;
  ASSERT_EQ(ranges.size(), expectedCount);

  uint64_t offset = 0;
  for (size_t i = 0; i < ranges.size(); ++i) {
    EXPECT_EQ(ranges[i].index, i);
    EXPECT_EQ(ranges[i].GetPartNumber(), static_cast<int>(i) + 1);
    EXPECT_EQ(ranges[i].offset, offset);  // no gap, no overlap
    EXPECT_GT(ranges[i].length, 0u);
    if (i + 1 < ranges.size()) {
      EXPECT_EQ(ranges[i].length, chunkSize);
    } else {
      EXPECT_LE(ranges[i].length, chunkSize);
      EXPECT_EQ(ranges[i].length, totalSize - ranges[i].offset);
    }
    offset += ranges[i].length;
  }
  EXPECT_EQ(offset, totalSize);
}

TEST(ChunkPlannerTest, PartitionsWholeObject) {
  VerifyPartition(1, 1);
  VerifyPartition(1, 10);
  VerifyPartition(10, 1);
  VerifyPartition(10, 3);
  VerifyPartition(10, 5);
  VerifyPartition(10, 10);
  VerifyPartition(11, 10);
  VerifyPartition(QSX::Size::MB1 + 17, QSX::Size::KB4);

  // pseudo random sizes
  uint64_t seed = 12345;
  for (int i = 0; i < 200; ++i) {
    seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
    uint64_t total = (seed >> 33) % 100000 + 1;
    uint64_t chunk = (seed >> 13) % 5000 + 1;
    VerifyPartition(total, chunk);
  }
}

TEST(ChunkPlannerTest, ThreeChunksFor25MB) {
  ChunkPlanOutcome plan = PlanChunks(25000000, 10000000, 10000);
  ASSERT_TRUE(plan.IsSuccess());
  const ChunkRangeList &ranges = plan.GetResult();
  ASSERT_EQ(ranges.size(), 3u);
  EXPECT_EQ(ranges[0].offset, 0u);
  EXPECT_EQ(ranges[0].length, 10000000u);
  EXPECT_EQ(ranges[1].offset, 10000000u);
  EXPECT_EQ(ranges[1].length, 10000000u);
  EXPECT_EQ(ranges[2].offset, 20000000u);
  EXPECT_EQ(ranges[2].length, 5000000u);
  EXPECT_EQ(ranges[2].GetPartNumber(), 3);
}

TEST(ChunkPlannerTest, EmptyObject) {
  ChunkPlanOutcome plan = PlanChunks(0, 10, 10);
  ASSERT_FALSE(plan.IsSuccess());
  EXPECT_EQ(plan.GetError().GetError(), TransferError::EMPTY_OBJECT);
  EXPECT_FALSE(plan.GetError().ShouldRetry());
  EXPECT_TRUE(plan.GetResult().empty());

  plan = PlanChunks(0, 1, 0);
  EXPECT_EQ(plan.GetError().GetError(), TransferError::EMPTY_OBJECT);
}

TEST(ChunkPlannerTest, TooManyChunks) {
  ChunkPlanOutcome plan = PlanChunks(12000, 1, 10000);
  ASSERT_FALSE(plan.IsSuccess());
  EXPECT_EQ(plan.GetError().GetError(), TransferError::TOO_MANY_CHUNKS);

  // exactly at the ceiling is fine
  plan = PlanChunks(10000, 1, 10000);
  ASSERT_TRUE(plan.IsSuccess());
  EXPECT_EQ(plan.GetResult().size(), 10000u);

  plan = PlanChunks(10001, 1, 10000);
  EXPECT_EQ(plan.GetError().GetError(), TransferError::TOO_MANY_CHUNKS);
}

TEST(ChunkPlannerTest, CeilingFitsPartNumbers) {
  ChunkPlanOutcome plan =
      PlanChunks(MaxChunkCount + 1, 1, static_cast<uint64_t>(UINT_MAX) + 7);
  ASSERT_FALSE(plan.IsSuccess());
  EXPECT_EQ(plan.GetError().GetError(), TransferError::TOO_MANY_CHUNKS);

  plan = PlanChunks(UINT64_MAX, 1, UINT64_MAX);
  EXPECT_EQ(plan.GetError().GetError(), TransferError::TOO_MANY_CHUNKS);

  ChunkRange last(static_cast<uint32_t>(MaxChunkCount - 1), 0, 1);
  EXPECT_EQ(last.GetPartNumber(), INT_MAX);
}

TEST(ChunkPlannerTest, ZeroChunkSize) {
  ChunkPlanOutcome plan = PlanChunks(10, 0, 10000);
  ASSERT_FALSE(plan.IsSuccess());
  EXPECT_EQ(plan.GetError().GetError(), TransferError::TOO_MANY_CHUNKS);
}

TEST(ChunkPlannerTest, CountChunks) {
  EXPECT_EQ(CountChunks(1, 1), 1u);
  EXPECT_EQ(CountChunks(9, 10), 1u);
  EXPECT_EQ(CountChunks(10, 10), 1u);
  EXPECT_EQ(CountChunks(11, 10), 2u);
  EXPECT_EQ(CountChunks(25000000, 10000000), 3u);
}

}  // namespace Client
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
