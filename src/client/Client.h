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

#ifndef QSXFER_CLIENT_CLIENT_H_
#define QSXFER_CLIENT_CLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread_time.hpp"

#include "client/RetryStrategy.h"
#include "client/StoreError.h"

namespace QSX {

namespace Client {

// One uploaded part of a multipart session
struct CompletedPart {
  CompletedPart() : partNumber(0) {}
  CompletedPart(int number, const std::string &tag)
      : partNumber(number), partTag(tag) {}

  int partNumber;       // 1-based
  std::string partTag;  // opaque tag returned by the store
};

// One entry of a listing
struct ObjectSummary {
  ObjectSummary() : size(0) {}
  ObjectSummary(const std::string &k, uint64_t sz) : key(k), size(sz) {}

  std::string key;
  uint64_t size;
};

//
// Client
//
// Object store collaborator used by the transfer engine. Every request is a
// single attempt, retries are driven by the caller with the client's retry
// strategy. Implementations must be safe to call from many threads at once.
//
class Client : private boost::noncopyable {
 public:
  explicit Client(
      const RetryStrategy &retryStrategy = GetDefaultRetryStrategy());

  virtual ~Client();

 public:
  // Get object data
  //
  // @param  : bucket, key, offset, length, buffer (output)
  // @return : StoreClientError
  //
  // Fetch [offset, offset + length) of the object. Use length 0 to get the
  // whole object. Buffer is replaced by the bytes received, which may be
  // fewer than asked for.
  virtual StoreClientError GetObject(const std::string &bucket,
                                     const std::string &key, uint64_t offset,
                                     uint64_t length,
                                     std::vector<char> *buffer) = 0;

  // Put object in one request
  //
  // @param  : bucket, key, body
  // @return : StoreClientError
  virtual StoreClientError PutObject(const std::string &bucket,
                                     const std::string &key,
                                     const std::vector<char> &body) = 0;

  // Initiate multipart upload
  //
  // @param  : bucket, key, upload id (output)
  // @return : StoreClientError
  virtual StoreClientError InitiateMultipartUpload(const std::string &bucket,
                                                   const std::string &key,
                                                   std::string *uploadId) = 0;

  // Upload multipart
  //
  // @param  : bucket, key, upload id, part number (1-based), body,
  //           part tag (output)
  // @return : StoreClientError
  virtual StoreClientError UploadMultipart(const std::string &bucket,
                                           const std::string &key,
                                           const std::string &uploadId,
                                           int partNumber,
                                           const std::vector<char> &body,
                                           std::string *partTag) = 0;

  // Complete multipart upload
  //
  // @param  : bucket, key, upload id, parts sorted by part number
  // @return : StoreClientError
  virtual StoreClientError CompleteMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId,
      const std::vector<CompletedPart> &sortedParts) = 0;

  // Abort multipart upload
  //
  // @param  : bucket, key, upload id
  // @return : StoreClientError
  virtual StoreClientError AbortMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId) = 0;

  // Head object
  //
  // @param  : bucket, key, size (output)
  // @return : StoreClientError, NOT_FOUND if no such key
  virtual StoreClientError HeadObject(const std::string &bucket,
                                      const std::string &key,
                                      uint64_t *size) = 0;

  // List objects
  //
  // @param  : bucket, prefix, summaries (output)
  // @return : StoreClientError
  //
  // Lists every key starting with prefix, all pages included.
  virtual StoreClientError ListObjects(
      const std::string &bucket, const std::string &prefix,
      std::vector<ObjectSummary> *summaries) = 0;

 public:
  // Sleep before the next attempt, interrupted by InterruptRetrySleep
  void RetryRequestSleep(boost::posix_time::milliseconds sleepTime) const;

  // Wake up every thread sleeping in RetryRequestSleep
  void InterruptRetrySleep() const;

  const RetryStrategy &GetRetryStrategy() const { return m_retryStrategy; }

 private:
  RetryStrategy m_retryStrategy;
  mutable boost::mutex m_retryLock;
  mutable boost::condition_variable m_retrySignal;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_CLIENT_H_
