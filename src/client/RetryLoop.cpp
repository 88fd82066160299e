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

#include "client/RetryLoop.h"

#include <stdint.h>

#include <exception>
#include <string>

#include "boost/date_time/posix_time/posix_time_types.hpp"

#include "base/LogMacros.h"
#include "client/Client.h"

namespace QSX {

namespace Client {

using std::string;

// --------------------------------------------------------------------------
StoreClientError RetryLoop::Run(const Attempt &attempt,
                                const string &description) {
  m_attempts = 0;
  m_delays.clear();

  StoreClientError err;
  while (true) {
    err = AttemptOnce(attempt, description);
    ++m_attempts;
    if (IsGoodStoreError(err) || !m_strategy.ShouldRetry(err, m_attempts)) {
      break;
    }

    uint32_t delay = m_strategy.CalculateDelayBeforeNextRetry(m_attempts);
    m_delays.push_back(delay);
    DebugWarning(description << " attempt " << m_attempts << "/"
                             << m_strategy.GetMaxAttempts() << " failed ["
                             << GetMessageForStoreError(err) << "], retry in "
                             << delay << "ms");
    m_client.RetryRequestSleep(boost::posix_time::milliseconds(delay));
  }
  return err;
}

// --------------------------------------------------------------------------
StoreClientError RetryLoop::AttemptOnce(const Attempt &attempt,
                                        const string &description) {
  try {
    return attempt();
  } catch (const std::exception &err) {
    return StoreClientError(StoreError::UNKNOWN, description, err.what(),
                            false);
  }
}

}  // namespace Client
}  // namespace QSX
