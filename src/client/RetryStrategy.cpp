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

#include "client/RetryStrategy.h"

#include <stdint.h>

#include "configure/Default.h"

namespace QSX {

namespace Client {

// Backoff stops growing after this many doublings.
static const uint16_t MaxBackoffExponent = 10;

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(const StoreClientError &error,
                                uint16_t attempted) const {
  return attempted >= m_maxAttempts ? false : error.ShouldRetry();
}

// --------------------------------------------------------------------------
uint32_t RetryStrategy::CalculateDelayBeforeNextRetry(
    uint16_t attempted) const {
  if (attempted == 0) {
    return 0;
  }
  uint16_t exponent =
      attempted - 1 < MaxBackoffExponent ? attempted - 1 : MaxBackoffExponent;
  return (1u << exponent) * static_cast<uint32_t>(m_scaleFactor);
}

// --------------------------------------------------------------------------
RetryStrategy GetDefaultRetryStrategy() {
  return RetryStrategy(QSX::Configure::Default::GetDefaultChunkMaxRetries(),
                       QSX::Configure::Default::GetDefaultRetryScaleFactor());
}

}  // namespace Client
}  // namespace QSX
