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

#include "client/Operations.h"

#include <errno.h>
#include <string.h>

#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "client/Client.h"
#include "client/RetryLoop.h"
#include "client/TransferWorker.h"

namespace QSX {

namespace Client {

namespace Operations {

using QSX::StringUtils::EndsWith;
using QSX::StringUtils::FormatObject;
using QSX::StringUtils::FormatPath;
using std::map;
using std::ofstream;
using std::pair;
using std::string;
using std::vector;

namespace {

StoreClientError ListSummaries(Client &client, const string &bucket,
                               const string &prefix,
                               vector<ObjectSummary> *summaries) {
  RetryLoop loop(client, client.GetRetryStrategy());
  StoreClientError err =
      loop.Run(boost::bind(&Client::ListObjects, &client, bucket, prefix,
                           summaries),
               "ListObjects");
  ErrorIf(!IsGoodStoreError(err),
          "Unable to list " << FormatObject(bucket, prefix) << " "
                            << GetMessageForStoreError(err));
  return err;
}

bool IsDirectoryMarker(const ObjectSummary &summary) {
  return EndsWith(summary.key, "/");
}

}  // namespace

// --------------------------------------------------------------------------
StoreClientError UploadFile(Client &client, const string &bucket,
                            const string &filePath, const string &objKey) {
  pair<bool, uint64_t> res = QSX::Utils::GetFileSize(filePath);
  if (!res.first) {
    return MakeStoreError(StoreError::LOCAL_IO_ERROR, "UploadFile",
                          "Unable to get size of " + FormatPath(filePath) +
                              " " + strerror(errno));
  }
  vector<char> body;
  StoreClientError err = ReadFileRange(filePath, 0, res.second, &body);
  if (!IsGoodStoreError(err)) {
    return err;
  }

  RetryLoop loop(client, client.GetRetryStrategy());
  err = loop.Run(boost::bind(&Client::PutObject, &client, bucket, objKey,
                             boost::cref(body)),
                 "PutObject");
  if (IsGoodStoreError(err)) {
    Info("Put " << FormatPath(filePath) << " to "
                << FormatObject(bucket, objKey));
  } else {
    Error("Unable to put " << FormatObject(bucket, objKey) << " "
                           << GetMessageForStoreError(err));
  }
  return err;
}

// --------------------------------------------------------------------------
StoreClientError DownloadFile(Client &client, const string &bucket,
                              const string &objKey, const string &filePath) {
  vector<char> buffer;
  StoreClientError err = ReadObject(client, bucket, objKey, &buffer);
  if (!IsGoodStoreError(err)) {
    return err;
  }

  ofstream file(filePath.c_str(), std::ios_base::out | std::ios_base::binary |
                                      std::ios_base::trunc);
  if (file && !buffer.empty()) {
    file.write(&buffer[0], buffer.size());
  }
  file.close();
  if (!file) {
    return MakeStoreError(StoreError::LOCAL_IO_ERROR, "DownloadFile",
                          "Unable to write " + FormatPath(filePath) + " " +
                              strerror(errno));
  }
  Info("Got " << FormatObject(bucket, objKey) << " to "
              << FormatPath(filePath));
  return err;
}

// --------------------------------------------------------------------------
StoreClientError ReadObject(Client &client, const string &bucket,
                            const string &objKey, vector<char> *buffer) {
  RetryLoop loop(client, client.GetRetryStrategy());
  StoreClientError err = loop.Run(
      boost::bind(&Client::GetObject, &client, bucket, objKey, 0, 0, buffer),
      "GetObject");
  ErrorIf(!IsGoodStoreError(err) && err.GetError() != StoreError::NOT_FOUND,
          "Unable to get " << FormatObject(bucket, objKey) << " "
                           << GetMessageForStoreError(err));
  return err;
}

// --------------------------------------------------------------------------
StoreClientError TryGetObject(Client &client, const string &bucket,
                              const string &objKey, vector<char> *buffer,
                              bool *found) {
  StoreClientError err = ReadObject(client, bucket, objKey, buffer);
  if (err.GetError() == StoreError::NOT_FOUND) {
    DebugInfo("No object " << FormatObject(bucket, objKey));
    *found = false;
    return StoreClientError(StoreError::GOOD, false);
  }
  *found = IsGoodStoreError(err);
  return err;
}

// --------------------------------------------------------------------------
ListKeysOutcome ListKeys(Client &client, const string &bucket,
                         const string &prefix) {
  vector<ObjectSummary> summaries;
  StoreClientError err = ListSummaries(client, bucket, prefix, &summaries);
  if (!IsGoodStoreError(err)) {
    return ListKeysOutcome(err);
  }
  vector<string> keys;
  BOOST_FOREACH(const ObjectSummary &summary, summaries) {
    if (!IsDirectoryMarker(summary)) {
      keys.push_back(summary.key);
    }
  }
  return ListKeysOutcome(keys);
}

// --------------------------------------------------------------------------
ListKeysToMapOutcome ListKeysToMap(Client &client, const string &bucket,
                                   const string &prefix) {
  vector<ObjectSummary> summaries;
  StoreClientError err = ListSummaries(client, bucket, prefix, &summaries);
  if (!IsGoodStoreError(err)) {
    return ListKeysToMapOutcome(err);
  }
  map<string, uint64_t> keys;
  BOOST_FOREACH(const ObjectSummary &summary, summaries) {
    if (!IsDirectoryMarker(summary)) {
      keys[summary.key] = summary.size;
    }
  }
  return ListKeysToMapOutcome(keys);
}

}  // namespace Operations
}  // namespace Client
}  // namespace QSX
