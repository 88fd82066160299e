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

#ifndef QSXFER_CLIENT_TRANSFERMANAGER_H_
#define QSXFER_CLIENT_TRANSFERMANAGER_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ChunkPlanner.h"
#include "client/RetryStrategy.h"
#include "configure/Default.h"

namespace QSX {

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Client {

class Client;
class ResultAggregator;
class TransferHandle;
struct ChunkOutcome;

struct TransferManagerConfigure {
  // Bytes per chunk, the last chunk of an object may be smaller
  uint64_t m_chunkSize;

  // Upper bound of chunks per object. Raise chunk size for larger objects.
  uint64_t m_maxChunks;

  // Maximum number of chunks in flight at the same time
  size_t m_workerBudget;

  // Attempts per chunk, the first one included
  uint16_t m_maxRetriesPerChunk;

  // Backoff unit between chunk attempts, in milliseconds
  uint16_t m_retryScaleFactor;

  TransferManagerConfigure(
      uint64_t chunkSize = QSX::Configure::Default::GetDefaultChunkSize(),
      uint64_t maxChunks = QSX::Configure::Default::GetDefaultMaxChunks(),
      size_t workerBudget = QSX::Configure::Default::GetDefaultWorkerBudget(),
      uint16_t maxRetriesPerChunk =
          QSX::Configure::Default::GetDefaultChunkMaxRetries(),
      uint16_t retryScaleFactor =
          QSX::Configure::Default::GetDefaultRetryScaleFactor())
      : m_chunkSize(chunkSize),
        m_maxChunks(maxChunks),
        m_workerBudget(workerBudget > 0 ? workerBudget : 1),
        m_maxRetriesPerChunk(maxRetriesPerChunk),
        m_retryScaleFactor(retryScaleFactor) {}
};

//
// TransferManager
//
// Runs chunked transfers. Each transfer plans its chunks, dispatches them in
// index order to the worker pool through a concurrency gate sized by the
// worker budget, collects their outcomes and finalizes. A failed chunk
// stops further dispatching, chunks already in flight finish and are
// dropped. Transfers are synchronous, a manager may run several transfers
// from different threads sharing the worker pool.
//
class TransferManager : private boost::noncopyable {
 public:
  TransferManager(
      const boost::shared_ptr<Client> &client,
      const TransferManagerConfigure &config = TransferManagerConfigure());

  ~TransferManager();

 public:
  // Upload a file by multipart upload
  //
  // @param  : local file path, bucket, object key, file size
  // @return : transfer handle in state Completed or Failed
  //
  // A file size of 0 means the size is taken from the file itself. The
  // multipart session is opened after planning succeeds and is aborted if
  // the transfer fails before commit. After commit, the size reported by
  // the store must equal the file size.
  boost::shared_ptr<TransferHandle> UploadFile(const std::string &filePath,
                                               const std::string &bucket,
                                               const std::string &objKey,
                                               uint64_t fileSize = 0);

  // Download an object into memory by ranged requests
  //
  // @param  : bucket, object key
  // @return : transfer handle holding the assembled bytes when Completed
  boost::shared_ptr<TransferHandle> DownloadObject(const std::string &bucket,
                                                   const std::string &objKey);

  // Download an object into a local file by ranged requests
  //
  // @param  : bucket, object key, local file path
  // @return : transfer handle in state Completed or Failed
  //
  // The file is written only once every chunk has arrived and the size
  // checks out, an existing file is truncated.
  boost::shared_ptr<TransferHandle> DownloadFile(const std::string &bucket,
                                                 const std::string &objKey,
                                                 const std::string &filePath);

 public:
  const TransferManagerConfigure &GetConfigure() const { return m_configure; }
  RetryStrategy GetChunkRetryStrategy() const;

 private:
  typedef boost::function<ChunkOutcome(const ChunkRange &)> ChunkWork;

  boost::shared_ptr<TransferHandle> Download(const std::string &bucket,
                                             const std::string &objKey,
                                             const std::string &filePath);

  // Plan the chunks of the handle, fail the handle on error
  bool Plan(const boost::shared_ptr<TransferHandle> &handle, uint64_t size,
            ChunkRangeList *ranges);

  // Dispatch every chunk and wait for those dispatched to finish
  //
  // @param  : handle, chunk ranges, work, aggregator
  // @return : true if every chunk succeeded
  bool DispatchAndAggregate(const boost::shared_ptr<TransferHandle> &handle,
                            const ChunkRangeList &ranges,
                            const ChunkWork &work,
                            const boost::shared_ptr<ResultAggregator> &agg);

  // Best effort abort of the open multipart session of the handle
  void AbortUpload(const boost::shared_ptr<TransferHandle> &handle);

  // Move to Completed
  void Complete(const boost::shared_ptr<TransferHandle> &handle);

 private:
  TransferManagerConfigure m_configure;
  boost::shared_ptr<Client> m_client;

  // Workers of every transfer of this manager
  boost::shared_ptr<QSX::Threading::ThreadPool> m_executor;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_TRANSFERMANAGER_H_
