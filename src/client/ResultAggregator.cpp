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

#include "client/ResultAggregator.h"

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <ostream>
#include <vector>

#include "boost/bind.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace QSX {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::optional;
using boost::unique_lock;
using std::map;
using std::ostream;
using std::vector;

namespace {

bool ReceivedAtLeast(const size_t *received, size_t count) {
  return *received >= count;
}

}  // namespace

// --------------------------------------------------------------------------
void ResultAggregator::Add(const ChunkOutcome &outcome) {
  {
    lock_guard<mutex> lock(m_lock);
    ++m_received;
    if (m_firstFailure) {
      DebugInfo("Drop outcome of chunk " << outcome.index
                                         << " after transfer failure");
    } else if (!outcome.success) {
      m_firstFailure = outcome;
      m_successes.clear();
    } else if (outcome.index < m_chunkCount) {
      m_successes[outcome.index] = outcome;
    } else {
      DebugWarning("Ignore outcome of unplanned chunk " << outcome.index);
    }
  }
  m_receivedCond.notify_all();
}

// --------------------------------------------------------------------------
bool ResultAggregator::ShouldContinue() const {
  lock_guard<mutex> lock(m_lock);
  return !m_firstFailure;
}

// --------------------------------------------------------------------------
void ResultAggregator::WaitUntilDrained(size_t dispatched) const {
  unique_lock<mutex> lock(m_lock);
  m_receivedCond.wait(lock,
                      boost::bind(&ReceivedAtLeast, &m_received, dispatched));
}

// --------------------------------------------------------------------------
bool ResultAggregator::IsCompleteNoLock() const {
  return !m_firstFailure && m_successes.size() == m_chunkCount;
}

// --------------------------------------------------------------------------
bool ResultAggregator::IsComplete() const {
  lock_guard<mutex> lock(m_lock);
  return IsCompleteNoLock();
}

// --------------------------------------------------------------------------
optional<ChunkOutcome> ResultAggregator::GetFirstFailure() const {
  lock_guard<mutex> lock(m_lock);
  return m_firstFailure;
}

// --------------------------------------------------------------------------
size_t ResultAggregator::GetReceivedCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_received;
}

// --------------------------------------------------------------------------
vector<CompletedPart> ResultAggregator::GetSortedParts() const {
  lock_guard<mutex> lock(m_lock);
  vector<CompletedPart> parts;
  if (!IsCompleteNoLock()) {
    return parts;
  }
  parts.reserve(m_chunkCount);
  // map iterates in ascending index order
  for (map<uint32_t, ChunkOutcome>::const_iterator it = m_successes.begin();
       it != m_successes.end(); ++it) {
    parts.push_back(CompletedPart(static_cast<int>(it->first) + 1,
                                  it->second.partTag));
  }
  return parts;
}

// --------------------------------------------------------------------------
uint64_t ResultAggregator::GetAssembledSize() const {
  lock_guard<mutex> lock(m_lock);
  uint64_t total = 0;
  if (!IsCompleteNoLock()) {
    return total;
  }
  for (map<uint32_t, ChunkOutcome>::const_iterator it = m_successes.begin();
       it != m_successes.end(); ++it) {
    total += it->second.bytes ? it->second.bytes->size() : 0;
  }
  return total;
}

// --------------------------------------------------------------------------
vector<char> ResultAggregator::Assemble() {
  uint64_t total = GetAssembledSize();
  lock_guard<mutex> lock(m_lock);
  vector<char> data;
  if (!IsCompleteNoLock()) {
    return data;
  }
  data.reserve(total);
  for (map<uint32_t, ChunkOutcome>::iterator it = m_successes.begin();
       it != m_successes.end(); ++it) {
    if (it->second.bytes) {
      data.insert(data.end(), it->second.bytes->begin(),
                  it->second.bytes->end());
      it->second.bytes.reset();
    }
  }
  return data;
}

// --------------------------------------------------------------------------
bool ResultAggregator::WriteTo(ostream &os) {
  lock_guard<mutex> lock(m_lock);
  if (!IsCompleteNoLock()) {
    return false;
  }
  for (map<uint32_t, ChunkOutcome>::iterator it = m_successes.begin();
       it != m_successes.end() && os; ++it) {
    if (it->second.bytes && !it->second.bytes->empty()) {
      os.write(&(*it->second.bytes)[0], it->second.bytes->size());
    }
    it->second.bytes.reset();
  }
  return static_cast<bool>(os);
}

}  // namespace Client
}  // namespace QSX
