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

#ifndef QSXFER_CLIENT_RETRYLOOP_H_
#define QSXFER_CLIENT_RETRYLOOP_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/function.hpp"

#include "client/RetryStrategy.h"
#include "client/StoreError.h"

namespace QSX {

namespace Client {

class Client;

//
// RetryLoop
//
// Attempt counter, last error and delay schedule of one request. Each call
// of the attempt function is one network request. Between two attempts the
// loop sleeps on the client, so Client::InterruptRetrySleep cuts the delay
// short. An exception thrown by an attempt ends the loop as a permanent
// UNKNOWN error.
//
class RetryLoop {
 public:
  typedef boost::function<StoreClientError()> Attempt;

  RetryLoop(const Client &client, const RetryStrategy &strategy)
      : m_client(client), m_strategy(strategy), m_attempts(0) {}

 public:
  // Run attempts until one succeeds, fails permanently or none is left
  //
  // @param  : attempt, request description used in log
  // @return : error of the last attempt
  StoreClientError Run(const Attempt &attempt, const std::string &description);

  uint16_t GetAttempts() const { return m_attempts; }

  // Delays slept so far, in milliseconds
  const std::vector<uint32_t> &GetDelays() const { return m_delays; }

  const RetryStrategy &GetRetryStrategy() const { return m_strategy; }

 private:
  StoreClientError AttemptOnce(const Attempt &attempt,
                               const std::string &description);

 private:
  const Client &m_client;
  RetryStrategy m_strategy;
  uint16_t m_attempts;
  std::vector<uint32_t> m_delays;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_RETRYLOOP_H_
