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

#ifndef QSXFER_CLIENT_MEMORYCLIENT_H_
#define QSXFER_CLIENT_MEMORYCLIENT_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "client/Client.h"

namespace QSX {

namespace Client {

//
// MemoryClient
//
// Object store kept in process memory, with multipart sessions. Used for
// dry runs and by the unit tests, which derive from it to inject failures.
// All calls are thread safe.
//
class MemoryClient : public Client {
 public:
  explicit MemoryClient(
      const RetryStrategy &retryStrategy = GetDefaultRetryStrategy());
  ~MemoryClient() {}

 public:
  StoreClientError GetObject(const std::string &bucket, const std::string &key,
                             uint64_t offset, uint64_t length,
                             std::vector<char> *buffer);

  StoreClientError PutObject(const std::string &bucket, const std::string &key,
                             const std::vector<char> &body);

  StoreClientError InitiateMultipartUpload(const std::string &bucket,
                                           const std::string &key,
                                           std::string *uploadId);

  StoreClientError UploadMultipart(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &uploadId, int partNumber,
                                   const std::vector<char> &body,
                                   std::string *partTag);

  // Parts must be sorted, unique and all uploaded. The object is the
  // concatenation of the listed parts.
  StoreClientError CompleteMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId,
      const std::vector<CompletedPart> &sortedParts);

  StoreClientError AbortMultipartUpload(const std::string &bucket,
                                        const std::string &key,
                                        const std::string &uploadId);

  StoreClientError HeadObject(const std::string &bucket,
                              const std::string &key, uint64_t *size);

  StoreClientError ListObjects(const std::string &bucket,
                               const std::string &prefix,
                               std::vector<ObjectSummary> *summaries);

 public:
  // Inspection, for tests and dry runs

  bool HasObject(const std::string &bucket, const std::string &key) const;
  std::vector<char> GetStoredObject(const std::string &bucket,
                                    const std::string &key) const;

  // Number of calls made to the named operation, such as "UploadMultipart"
  size_t GetRequestCount(const std::string &operation) const;
  size_t GetTotalRequestCount() const;

  size_t GetOpenUploadCount() const;
  const std::vector<std::string> GetAbortedUploads() const;

  // Parts passed to the last successful CompleteMultipartUpload
  const std::vector<CompletedPart> GetLastCompletedParts() const;

 protected:
  void CountRequest(const std::string &operation);

 private:
  struct Upload {
    std::string bucket;
    std::string key;
    std::map<int, std::vector<char> > parts;  // part number -> data
    std::map<int, std::string> tags;          // part number -> issued tag
  };

  typedef std::map<std::string, std::vector<char> > ObjectMap;  // by key

  mutable boost::mutex m_lock;
  std::map<std::string, ObjectMap> m_buckets;
  std::map<std::string, Upload> m_uploads;  // by upload id
  uint64_t m_nextUploadId;
  std::map<std::string, size_t> m_requestCounts;
  std::vector<std::string> m_abortedUploads;
  std::vector<CompletedPart> m_lastCompletedParts;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_MEMORYCLIENT_H_
