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

#include "client/Client.h"

#include "boost/thread/locks.hpp"

namespace QSX {

namespace Client {

// --------------------------------------------------------------------------
Client::Client(const RetryStrategy &retryStrategy)
    : m_retryStrategy(retryStrategy) {}

// --------------------------------------------------------------------------
Client::~Client() {
  // do nothing
}

// --------------------------------------------------------------------------
void Client::RetryRequestSleep(
    boost::posix_time::milliseconds sleepTime) const {
  if (sleepTime.total_milliseconds() <= 0) {
    return;
  }
  boost::unique_lock<boost::mutex> lock(m_retryLock);
  m_retrySignal.timed_wait(lock, sleepTime);
}

// --------------------------------------------------------------------------
void Client::InterruptRetrySleep() const {
  boost::lock_guard<boost::mutex> lock(m_retryLock);
  m_retrySignal.notify_all();
}

}  // namespace Client
}  // namespace QSX
