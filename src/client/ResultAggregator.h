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

#ifndef QSXFER_CLIENT_RESULTAGGREGATOR_H_
#define QSXFER_CLIENT_RESULTAGGREGATOR_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <ostream>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/Client.h"
#include "client/TransferWorker.h"

namespace QSX {

namespace Client {

//
// ResultAggregator
//
// Collects chunk outcomes in completion order and keeps them keyed by chunk
// index. The first failure wins: from then on ShouldContinue is false and
// later outcomes are counted but dropped. Thread safe.
//
class ResultAggregator : private boost::noncopyable {
 public:
  explicit ResultAggregator(size_t chunkCount)
      : m_chunkCount(chunkCount), m_received(0) {}

 public:
  // Add the outcome of one chunk, called from worker threads
  void Add(const ChunkOutcome &outcome);

  // False once a chunk has failed
  bool ShouldContinue() const;

  // Block until the given number of outcomes have been added
  void WaitUntilDrained(size_t dispatched) const;

  // True if every chunk has succeeded
  bool IsComplete() const;

  // First failure added, if any
  boost::optional<ChunkOutcome> GetFirstFailure() const;

  size_t GetChunkCount() const { return m_chunkCount; }
  size_t GetReceivedCount() const;

  // Part list sorted by part number, empty unless complete
  std::vector<CompletedPart> GetSortedParts() const;

  // Total downloaded bytes held, 0 unless complete
  uint64_t GetAssembledSize() const;

  // Downloaded bytes concatenated in index order, empty unless complete.
  // Each chunk buffer is released once appended, so assembling drains the
  // aggregator and can be done once.
  std::vector<char> Assemble();

  // Write downloaded bytes to a stream in index order
  //
  // @param  : output stream
  // @return : false if not complete or the stream went bad
  //
  // Like Assemble, each chunk buffer is released once written.
  bool WriteTo(std::ostream &os);

 private:
  bool IsCompleteNoLock() const;

 private:
  size_t m_chunkCount;
  size_t m_received;
  std::map<uint32_t, ChunkOutcome> m_successes;  // by chunk index
  boost::optional<ChunkOutcome> m_firstFailure;
  mutable boost::mutex m_lock;
  mutable boost::condition_variable m_receivedCond;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_RESULTAGGREGATOR_H_
