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

#include "client/TransferHandle.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/StringUtils.h"

namespace QSX {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string TransferStateToString(TransferState::Value state) {
  static const char *names[] = {
      // keep in enum order
      "Planning", "Dispatching", "Aggregating",
      "Finalizing", "Completed", "Failed",
  };
  int n = sizeof(names) / sizeof(names[0]);
  int idx = static_cast<int>(state);
  return (idx >= 0 && idx < n) ? names[idx] : "Unknown";
}

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(const string &bucket, const string &objKey,
                               TransferDirection::Value direction,
                               const string &localPath)
    : m_bucket(bucket),
      m_objectKey(objKey),
      m_localPath(localPath),
      m_direction(direction),
      m_state(TransferState::Planning),
      m_chunkCount(0),
      m_error(TransferError::GOOD, false),
      m_storeError(StoreError::GOOD, false),
      m_failedChunkAttempts(0),
      m_expectedSize(0),
      m_actualSize(0),
      m_peakConcurrency(0) {
  m_stateHistory.push_back(m_state);
}

// --------------------------------------------------------------------------
TransferState::Value TransferHandle::GetState() const {
  lock_guard<mutex> lock(m_stateLock);
  return m_state;
}

// --------------------------------------------------------------------------
vector<TransferState::Value> TransferHandle::GetStateHistory() const {
  lock_guard<mutex> lock(m_stateLock);
  return m_stateHistory;
}

// --------------------------------------------------------------------------
bool TransferHandle::UpdateState(TransferState::Value state) {
  lock_guard<mutex> lock(m_stateLock);
  if (m_state == TransferState::Completed || m_state == TransferState::Failed) {
    return false;
  }
  if (state != TransferState::Failed &&
      static_cast<int>(state) != static_cast<int>(m_state) + 1) {
    return false;
  }
  m_state = state;
  m_stateHistory.push_back(state);
  return true;
}

// --------------------------------------------------------------------------
void TransferHandle::Fail(const TransferClientError &error,
                          const StoreClientError &storeError) {
  if (UpdateState(TransferState::Failed)) {
    m_error = error;
    m_storeError = storeError;
  }
}

// --------------------------------------------------------------------------
string TransferHandle::ToString() const {
  string str =
      (m_direction == TransferDirection::Upload ? "Upload " : "Download ") +
      QSX::StringUtils::FormatObject(m_bucket, m_objectKey) + " " +
      TransferStateToString(GetState());
  if (IsFailed()) {
    str += " [" + GetMessageForTransferError(m_error) + "]";
    if (m_failedChunkIndex) {
      str += " chunk " + to_string(*m_failedChunkIndex) + " after " +
             to_string(m_failedChunkAttempts) + " attempts";
    }
    if (!IsGoodStoreError(m_storeError)) {
      str += " [" + GetMessageForStoreError(m_storeError) + "]";
    }
  } else {
    str += " " + to_string(m_expectedSize) + " bytes in " +
           to_string(m_chunkCount) + " chunks";
  }
  return str;
}

}  // namespace Client
}  // namespace QSX
