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

#ifndef QSXFER_CLIENT_QSCLIENT_H_
#define QSXFER_CLIENT_QSCLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/Client.h"
#include "client/ClientConfiguration.h"

namespace QingStor {
class QsConfig;
}  // namespace QingStor

namespace QSX {

namespace Client {

class QSClientImpl;

//
// QSClient
//
// Client backed by the QingStor object storage. The sdk is initialized on
// first construction and shut down when the last QSClient goes away.
//
class QSClient : public Client {
 public:
  explicit QSClient(
      const ClientConfiguration &config,
      const RetryStrategy &retryStrategy = GetDefaultRetryStrategy());
  ~QSClient();

 public:
  StoreClientError GetObject(const std::string &bucket, const std::string &key,
                             uint64_t offset, uint64_t length,
                             std::vector<char> *buffer);

  StoreClientError PutObject(const std::string &bucket, const std::string &key,
                             const std::vector<char> &body);

  StoreClientError InitiateMultipartUpload(const std::string &bucket,
                                           const std::string &key,
                                           std::string *uploadId);

  // QingStor assembles parts by number, the part tag returned is the
  // decimal part number.
  StoreClientError UploadMultipart(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &uploadId, int partNumber,
                                   const std::vector<char> &body,
                                   std::string *partTag);

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

 private:
  static boost::shared_ptr<QingStor::QsConfig> StartQSService(
      const ClientConfiguration &config);
  static void CloseQSService();

  boost::shared_ptr<QSClientImpl> m_impl;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_QSCLIENT_H_
