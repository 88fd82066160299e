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

#include "client/TransferWorker.h"

#include <errno.h>
#include <string.h>

#include <fstream>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Client.h"
#include "client/RetryLoop.h"

namespace QSX {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using QSX::StringUtils::FormatObject;
using QSX::StringUtils::FormatPath;
using std::ifstream;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
StoreClientError ReadFileRange(const string &path, uint64_t offset,
                               uint64_t length, vector<char> *buffer) {
  ifstream file(path.c_str(), std::ios_base::in | std::ios_base::binary);
  if (!file) {
    return MakeStoreError(StoreError::LOCAL_IO_ERROR, "ReadFileRange",
                          "Unable to open " + FormatPath(path) + " " +
                              strerror(errno));
  }
  buffer->resize(length);
  file.seekg(offset, std::ios_base::beg);
  if (length > 0) {
    file.read(&(*buffer)[0], length);
  }
  if (!file || static_cast<uint64_t>(file.gcount()) != length) {
    return MakeStoreError(
        StoreError::LOCAL_IO_ERROR, "ReadFileRange",
        "Unable to read " + to_string(length) + " bytes at offset " +
            to_string(offset) + " of " + FormatPath(path));
  }
  return StoreClientError(StoreError::GOOD, false);
}

// --------------------------------------------------------------------------
ChunkOutcome TransferWorker::Upload(const UploadTarget &target,
                                    const ChunkRange &range) const {
  ChunkOutcome outcome;
  outcome.index = range.index;

  vector<char> body;
  StoreClientError err =
      ReadFileRange(target.localPath, range.offset, range.length, &body);
  if (!IsGoodStoreError(err)) {
    Error(range.ToString() << " " << GetMessageForStoreError(err));
    outcome.cause = err;
    return outcome;
  }

  string description = "UploadMultipart " +
                       FormatObject(target.bucket, target.key) + " part " +
                       to_string(range.GetPartNumber());
  RetryLoop loop(*m_client, m_retryStrategy);
  err = loop.Run(
      boost::bind(&Client::UploadMultipart, m_client.get(), target.bucket,
                  target.key, target.uploadId, range.GetPartNumber(),
                  boost::cref(body), &outcome.partTag),
      description);

  outcome.attempts = loop.GetAttempts();
  outcome.success = IsGoodStoreError(err);
  if (!outcome.success) {
    outcome.cause = err;
    outcome.partTag.clear();
    Error(description << " failed after " << outcome.attempts
                      << " attempts " << GetMessageForStoreError(err));
  }
  return outcome;
}

// --------------------------------------------------------------------------
StoreClientError TransferWorker::DownloadOnce(const DownloadSource &source,
                                              const ChunkRange &range,
                                              vector<char> *buffer) const {
  StoreClientError err = m_client->GetObject(source.bucket, source.key,
                                             range.offset, range.length,
                                             buffer);
  if (!IsGoodStoreError(err) || buffer->size() == range.length) {
    return err;
  }
  if (buffer->size() < range.length && source.objectSize > 0 &&
      range.offset + range.length == source.objectSize) {
    Warning("Received " << buffer->size() << " of " << range.length
                        << " bytes for last " << range.ToString() << " of "
                        << FormatObject(source.bucket, source.key));
    return err;
  }
  return MakeStoreError(StoreError::SHORT_READ, "DownloadChunk",
                        "Received " + to_string(buffer->size()) + " of " +
                            to_string(range.length) + " bytes for " +
                            range.ToString());
}

// --------------------------------------------------------------------------
ChunkOutcome TransferWorker::Download(const DownloadSource &source,
                                      const ChunkRange &range) const {
  ChunkOutcome outcome;
  outcome.index = range.index;

  shared_ptr<vector<char> > buffer = boost::make_shared<vector<char> >();
  string description =
      "GetObject " + FormatObject(source.bucket, source.key) + " " +
      QSX::StringUtils::FormatByteRange(range.offset, range.length);
  RetryLoop loop(*m_client, m_retryStrategy);
  StoreClientError err = loop.Run(
      boost::bind(&TransferWorker::DownloadOnce, this, boost::cref(source),
                  boost::cref(range), buffer.get()),
      description);

  outcome.attempts = loop.GetAttempts();
  outcome.success = IsGoodStoreError(err);
  if (outcome.success) {
    outcome.bytes = buffer;
  } else {
    outcome.cause = err;
    Error(description << " failed after " << outcome.attempts
                      << " attempts " << GetMessageForStoreError(err));
  }
  return outcome;
}

}  // namespace Client
}  // namespace QSX
