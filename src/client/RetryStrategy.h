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

#ifndef QSXFER_CLIENT_RETRYSTRATEGY_H_
#define QSXFER_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "client/StoreError.h"

namespace QSX {

namespace Client {

//
// RetryStrategy
//
// maxAttempts bounds the total number of attempts of one request, the first
// one included, so 1 means no retry at all. Delays grow exponentially from
// scaleFactor milliseconds and never decrease.
//
class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxAttempts, uint16_t scaleFactor)
      : m_maxAttempts(maxAttempts > 0 ? maxAttempts : 1),
        m_scaleFactor(scaleFactor) {}

  // Should retry after a failed attempt
  //
  // @param  : error of the last attempt, attempts made so far (>= 1)
  // @return : true if error is transient and attempts are left
  bool ShouldRetry(const StoreClientError &error, uint16_t attempted) const;

  // Delay before the next attempt
  //
  // @param  : attempts made so far
  // @return : milliseconds, 0 before the first attempt
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attempted) const;

  uint16_t GetMaxAttempts() const { return m_maxAttempts; }
  uint16_t GetScaleFactor() const { return m_scaleFactor; }

 private:
  uint16_t m_maxAttempts;
  uint16_t m_scaleFactor;
};

RetryStrategy GetDefaultRetryStrategy();

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_RETRYSTRATEGY_H_
