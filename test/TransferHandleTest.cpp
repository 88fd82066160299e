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

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/scoped_ptr.hpp"

#include "client/TransferHandle.h"

namespace QSX {

namespace Client {

using std::string;
using std::vector;
using ::testing::Test;

class TransferHandleTest : public Test {
 protected:
  void SetUp() {
    m_handle.reset(new TransferHandle("bucket", "key",
                                      TransferDirection::Upload, "/tmp/file"));
  }

  bool Move(TransferState::Value state) { return m_handle->UpdateState(state); }

  void Fail(TransferError::Value err) {
    m_handle->Fail(TransferClientError(err, "Test", "failed", false),
                   MakeStoreError(StoreError::SERVER_ERROR, "Test", "5xx"));
  }

  void Describe(uint64_t size, size_t chunks) {
    m_handle->SetExpectedSize(size);
    m_handle->SetChunkCount(chunks);
  }

  void SetFailedChunk(uint32_t index, uint16_t attempts) {
    m_handle->SetFailedChunk(index, attempts);
  }

  void MoveToFinalizing() {
    ASSERT_TRUE(Move(TransferState::Dispatching));
    ASSERT_TRUE(Move(TransferState::Aggregating));
    ASSERT_TRUE(Move(TransferState::Finalizing));
  }

  boost::scoped_ptr<TransferHandle> m_handle;
};

TEST_F(TransferHandleTest, Initial) {
  EXPECT_EQ(m_handle->GetState(), TransferState::Planning);
  EXPECT_EQ(m_handle->GetStateHistory().size(), 1u);
  EXPECT_FALSE(m_handle->IsCompleted());
  EXPECT_FALSE(m_handle->IsFailed());
  EXPECT_EQ(m_handle->GetBucket(), "bucket");
  EXPECT_EQ(m_handle->GetObjectKey(), "key");
  EXPECT_EQ(m_handle->GetLocalPath(), "/tmp/file");
  EXPECT_EQ(m_handle->GetDirection(), TransferDirection::Upload);
  EXPECT_TRUE(IsGoodTransferError(m_handle->GetError()));
  EXPECT_FALSE(m_handle->GetFailedChunkIndex());
}

TEST_F(TransferHandleTest, ForwardOnly) {
  // no skipping ahead
  EXPECT_FALSE(Move(TransferState::Aggregating));
  EXPECT_FALSE(Move(TransferState::Completed));
  EXPECT_FALSE(Move(TransferState::Planning));
  EXPECT_EQ(m_handle->GetState(), TransferState::Planning);

  MoveToFinalizing();
  // no going back
  EXPECT_FALSE(Move(TransferState::Dispatching));
  EXPECT_TRUE(Move(TransferState::Completed));
  EXPECT_TRUE(m_handle->IsCompleted());

  vector<TransferState::Value> history = m_handle->GetStateHistory();
  ASSERT_EQ(history.size(), 5u);
  for (size_t i = 0; i < history.size(); ++i) {
    EXPECT_EQ(static_cast<size_t>(history[i]), i);
  }
}

TEST_F(TransferHandleTest, CompletedIsTerminal) {
  MoveToFinalizing();
  ASSERT_TRUE(Move(TransferState::Completed));
  Fail(TransferError::CHUNK_FAILED);
  EXPECT_TRUE(m_handle->IsCompleted());
  EXPECT_TRUE(IsGoodTransferError(m_handle->GetError()));
  EXPECT_FALSE(Move(TransferState::Failed));
}

TEST_F(TransferHandleTest, FailFromAnyState) {
  ASSERT_TRUE(Move(TransferState::Dispatching));
  Fail(TransferError::CHUNK_FAILED);
  EXPECT_TRUE(m_handle->IsFailed());
  EXPECT_EQ(m_handle->GetError().GetError(), TransferError::CHUNK_FAILED);
  EXPECT_EQ(m_handle->GetStoreError().GetError(), StoreError::SERVER_ERROR);

  // the first failure is kept
  Fail(TransferError::SESSION_ERROR);
  EXPECT_EQ(m_handle->GetError().GetError(), TransferError::CHUNK_FAILED);
  EXPECT_FALSE(Move(TransferState::Aggregating));
  EXPECT_EQ(m_handle->GetStateHistory().size(), 3u);
}

TEST_F(TransferHandleTest, ToString) {
  Describe(100, 2);
  EXPECT_NE(m_handle->ToString().find("Planning"), string::npos);
  EXPECT_NE(m_handle->ToString().find("2 chunks"), string::npos);

  SetFailedChunk(1, 5);
  Fail(TransferError::CHUNK_FAILED);
  string str = m_handle->ToString();
  EXPECT_NE(str.find("Failed"), string::npos);
  EXPECT_NE(str.find("chunk 1 after 5 attempts"), string::npos);
}

TEST(TransferStateTest, Names) {
  EXPECT_EQ(TransferStateToString(TransferState::Planning), "Planning");
  EXPECT_EQ(TransferStateToString(TransferState::Finalizing), "Finalizing");
  EXPECT_EQ(TransferStateToString(TransferState::Failed), "Failed");
}

}  // namespace Client
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
