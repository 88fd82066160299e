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

#ifndef QSXFER_CLIENT_TRANSFERHANDLE_H_
#define QSXFER_CLIENT_TRANSFERHANDLE_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint16_t uint64_t

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/thread/mutex.hpp"

#include "client/Client.h"
#include "client/StoreError.h"
#include "client/TransferError.h"

namespace QSX {

namespace Client {

class TransferManager;
class TransferHandleTest;

struct TransferState {
  enum Value {
    Planning,     // computing chunks, opening the multipart session
    Dispatching,  // handing chunks to workers
    Aggregating,  // waiting for outstanding chunks
    Finalizing,   // commit or assemble, then verify size
    Completed,
    Failed
  };
};

struct TransferDirection {
  enum Value { Upload, Download };
};

std::string TransferStateToString(TransferState::Value state);

//
// TransferHandle
//
// State and result of one chunked transfer. States only move forward
// Planning, Dispatching, Aggregating, Finalizing, Completed, and any
// non-terminal state may move to Failed. Only the transfer manager changes
// a handle.
//
class TransferHandle : private boost::noncopyable {
 public:
  TransferHandle(const std::string &bucket, const std::string &objKey,
                 TransferDirection::Value direction,
                 const std::string &localPath = std::string());

  ~TransferHandle() {}

 public:
  TransferState::Value GetState() const;
  std::vector<TransferState::Value> GetStateHistory() const;
  bool IsCompleted() const { return GetState() == TransferState::Completed; }
  bool IsFailed() const { return GetState() == TransferState::Failed; }

  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetObjectKey() const { return m_objectKey; }
  const std::string &GetLocalPath() const { return m_localPath; }
  TransferDirection::Value GetDirection() const { return m_direction; }

  // Multipart session, empty for downloads
  const std::string &GetUploadId() const { return m_uploadId; }
  size_t GetChunkCount() const { return m_chunkCount; }

  // Failure context
  const TransferClientError &GetError() const { return m_error; }
  const StoreClientError &GetStoreError() const { return m_storeError; }
  const boost::optional<uint32_t> &GetFailedChunkIndex() const {
    return m_failedChunkIndex;
  }
  uint16_t GetFailedChunkAttempts() const { return m_failedChunkAttempts; }

  // Size of the source, and the size found by integrity verification
  uint64_t GetExpectedSize() const { return m_expectedSize; }
  uint64_t GetActualSize() const { return m_actualSize; }

  // Highest number of chunks in flight at the same time
  size_t GetPeakConcurrency() const { return m_peakConcurrency; }

  // Parts committed by an upload, sorted by part number
  const std::vector<CompletedPart> &GetCompletedParts() const {
    return m_completedParts;
  }

  // Assembled bytes of an in-memory download
  const std::vector<char> &GetData() const { return m_data; }

  // One line description of the outcome
  std::string ToString() const;

 private:
  // Move to state, return false if the move is not allowed
  bool UpdateState(TransferState::Value state);

  // Move to Failed with the given error
  void Fail(const TransferClientError &error,
            const StoreClientError &storeError = StoreClientError());

  void SetUploadId(const std::string &uploadId) { m_uploadId = uploadId; }
  void SetChunkCount(size_t count) { m_chunkCount = count; }
  void SetFailedChunk(uint32_t index, uint16_t attempts) {
    m_failedChunkIndex = index;
    m_failedChunkAttempts = attempts;
  }
  void SetExpectedSize(uint64_t size) { m_expectedSize = size; }
  void SetActualSize(uint64_t size) { m_actualSize = size; }
  void SetPeakConcurrency(size_t peak) { m_peakConcurrency = peak; }
  void SetCompletedParts(const std::vector<CompletedPart> &parts) {
    m_completedParts = parts;
  }
  std::vector<char> &GetMutableData() { return m_data; }

 private:
  std::string m_bucket;
  std::string m_objectKey;
  std::string m_localPath;  // empty for an in-memory download
  TransferDirection::Value m_direction;

  mutable boost::mutex m_stateLock;
  TransferState::Value m_state;
  std::vector<TransferState::Value> m_stateHistory;

  std::string m_uploadId;
  size_t m_chunkCount;

  TransferClientError m_error;
  StoreClientError m_storeError;
  boost::optional<uint32_t> m_failedChunkIndex;
  uint16_t m_failedChunkAttempts;

  uint64_t m_expectedSize;
  uint64_t m_actualSize;
  size_t m_peakConcurrency;

  std::vector<CompletedPart> m_completedParts;
  std::vector<char> m_data;

  friend class TransferManager;
  friend class TransferHandleTest;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_TRANSFERHANDLE_H_
