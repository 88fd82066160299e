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

#ifndef QSXFER_CLIENT_TRANSFERWORKER_H_
#define QSXFER_CLIENT_TRANSFERWORKER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/ChunkPlanner.h"
#include "client/RetryStrategy.h"
#include "client/StoreError.h"

namespace QSX {

namespace Client {

class Client;

// Result of transferring one chunk.
// On success partTag (upload) or bytes (download) is set, otherwise cause
// holds the error of the last attempt.
struct ChunkOutcome {
  ChunkOutcome() : index(0), success(false), attempts(0) {}

  uint32_t index;
  bool success;
  std::string partTag;
  boost::shared_ptr<std::vector<char> > bytes;
  StoreClientError cause;
  uint16_t attempts;  // network attempts made
};

// Source of a chunked upload
struct UploadTarget {
  std::string localPath;
  std::string bucket;
  std::string key;
  std::string uploadId;
};

// Source of a chunked download
struct DownloadSource {
  DownloadSource() : objectSize(0) {}

  std::string bucket;
  std::string key;
  uint64_t objectSize;  // declared content length, 0 if unknown
};

//
// TransferWorker
//
// Transfers a single chunk with per chunk retries. A worker touches only
// its own chunk, so one worker can be shared by every task of a transfer.
//
class TransferWorker {
 public:
  TransferWorker(const boost::shared_ptr<Client> &client,
                 const RetryStrategy &retryStrategy)
      : m_client(client), m_retryStrategy(retryStrategy) {}

 public:
  // Upload a chunk as one part
  //
  // @param  : upload target, chunk range
  // @return : ChunkOutcome
  //
  // Read exactly range.length bytes at range.offset of the local file and
  // send them as part range.index + 1. A local read failure is permanent
  // and makes no network attempt.
  ChunkOutcome Upload(const UploadTarget &target,
                      const ChunkRange &range) const;

  // Download a chunk
  //
  // @param  : download source, chunk range
  // @return : ChunkOutcome
  //
  // Fetch [range.offset, range.offset + range.length) of the object. A
  // response with fewer bytes is a SHORT_READ, which is retried, except on
  // the range ending at the declared object size. There the bytes received
  // are kept and the assembled size is checked when the transfer finalizes.
  ChunkOutcome Download(const DownloadSource &source,
                        const ChunkRange &range) const;

  const RetryStrategy &GetRetryStrategy() const { return m_retryStrategy; }

 private:
  StoreClientError DownloadOnce(const DownloadSource &source,
                                const ChunkRange &range,
                                std::vector<char> *buffer) const;

 private:
  boost::shared_ptr<Client> m_client;
  RetryStrategy m_retryStrategy;
};

// Read a span of a local file
//
// @param  : file path, offset, length, buffer (output)
// @return : GOOD, or LOCAL_IO_ERROR if the span cannot be read completely
StoreClientError ReadFileRange(const std::string &path, uint64_t offset,
                               uint64_t length, std::vector<char> *buffer);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_TRANSFERWORKER_H_
