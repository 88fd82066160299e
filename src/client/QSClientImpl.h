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

#ifndef QSXFER_CLIENT_QSCLIENTIMPL_H_
#define QSXFER_CLIENT_QSCLIENTIMPL_H_

#include <stdint.h>  // for uint64_t

#include <map>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/QsConfig.h"

#include "client/QSClientOutcome.h"

namespace QSX {

namespace Client {

//
// QSClientImpl
//
// Thin layer over the QingStor sdk. Each call is one sdk request, whose
// result is turned into an outcome. A sdk Bucket is created lazily for
// every bucket name and kept for the lifetime of the impl.
//
class QSClientImpl : private boost::noncopyable {
 public:
  QSClientImpl(const boost::shared_ptr<QingStor::QsConfig> &qsConfig,
               const std::string &zone);

  ~QSClientImpl() {}

 public:
  // List bucket objects
  //
  // @param  : bucket, input
  // @return : ListObjectsOutcome
  //
  // Follow the next marker until the listing is exhausted, one output is
  // kept for each page.
  ListObjectsOutcome ListObjects(const std::string &bucket,
                                 QingStor::ListObjectsInput *input);

  // Get object, range in input is optional
  GetObjectOutcome GetObject(const std::string &bucket,
                             const std::string &objKey,
                             QingStor::GetObjectInput *input);

  HeadObjectOutcome HeadObject(const std::string &bucket,
                               const std::string &objKey,
                               QingStor::HeadObjectInput *input);

  PutObjectOutcome PutObject(const std::string &bucket,
                             const std::string &objKey,
                             QingStor::PutObjectInput *input);

  InitiateMultipartUploadOutcome InitiateMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::InitiateMultipartUploadInput *input);

  UploadMultipartOutcome UploadMultipart(
      const std::string &bucket, const std::string &objKey,
      QingStor::UploadMultipartInput *input);

  CompleteMultipartUploadOutcome CompleteMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::CompleteMultipartUploadInput *input);

  AbortMultipartUploadOutcome AbortMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::AbortMultipartUploadInput *input);

 private:
  boost::shared_ptr<QingStor::Bucket> GetBucket(const std::string &bucket);

  typedef std::map<std::string, boost::shared_ptr<QingStor::Bucket> >
      BucketMap;

  boost::shared_ptr<QingStor::QsConfig> m_qsConfig;
  std::string m_zone;
  BucketMap m_buckets;
  boost::mutex m_bucketsLock;
};

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_QSCLIENTIMPL_H_
