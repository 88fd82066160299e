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

#include "client/QSClientImpl.h"

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"  // for sdk QsError
#include "qingstor/Types.h"     // for sdk QsOutput

#include "base/LogMacros.h"
#include "client/QSError.h"

namespace QSX {

namespace Client {

using boost::shared_ptr;
using QingStor::AbortMultipartUploadInput;
using QingStor::AbortMultipartUploadOutput;
using QingStor::Bucket;
using QingStor::CompleteMultipartUploadInput;
using QingStor::CompleteMultipartUploadOutput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::Http::HttpResponseCode;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::ListObjectsInput;
using QingStor::ListObjectsOutput;
using QingStor::PutObjectInput;
using QingStor::PutObjectOutput;
using QingStor::QsOutput;
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using std::string;
using std::vector;

namespace {

// --------------------------------------------------------------------------
StoreClientError BuildStoreError(QsError sdkErr, const string &exceptionName,
                                 const QsOutput &output) {
  HttpResponseCode rspCode = const_cast<QsOutput &>(output).GetResponseCode();
  StoreError::Value err = SDKResponseToStoreError(sdkErr, rspCode);

  // sdk error info is often empty, the response code goes first
  string errMsg = SDKResponseCodeToString(rspCode);
  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    QingStor::ResponseErrorInfo errInfo = output.GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code;
    errMsg += "; message:" + errInfo.message;
    errMsg += "; request:" + errInfo.requestID;
    errMsg += "; url:" + errInfo.url;
    errMsg += "]";
  }
  return MakeStoreError(err, exceptionName, errMsg);
}

// --------------------------------------------------------------------------
template <typename OutputType>
Outcome<OutputType, StoreClientError> MakeOutcome(QsError sdkErr,
                                                  const string &exceptionName,
                                                  const OutputType &output) {
  HttpResponseCode rspCode =
      const_cast<OutputType &>(output).GetResponseCode();
  if (SDKResponseSuccess(sdkErr, rspCode)) {
    return Outcome<OutputType, StoreClientError>(output);
  }
  return Outcome<OutputType, StoreClientError>(
      BuildStoreError(sdkErr, exceptionName, output));
}

// --------------------------------------------------------------------------
StoreClientError CheckRequest(const string &exceptionName,
                              const string &bucket, const string &objKey,
                              const void *input) {
  if (bucket.empty()) {
    return MakeStoreError(StoreError::PARAMETER_MISSING, exceptionName,
                          "Empty bucket");
  }
  if (objKey.empty()) {
    return MakeStoreError(StoreError::PARAMETER_MISSING, exceptionName,
                          "Empty ObjectKey");
  }
  if (input == NULL) {
    return MakeStoreError(StoreError::PARAMETER_MISSING, exceptionName,
                          "Null input");
  }
  return StoreClientError(StoreError::GOOD, false);
}

string DescribeObject(const string &api, const string &bucket,
                      const string &objKey) {
  return api + " bucket=" + bucket + " object=" + objKey;
}

}  // namespace

// --------------------------------------------------------------------------
QSClientImpl::QSClientImpl(const shared_ptr<QingStor::QsConfig> &qsConfig,
                           const string &zone)
    : m_qsConfig(qsConfig), m_zone(zone) {}

// --------------------------------------------------------------------------
shared_ptr<Bucket> QSClientImpl::GetBucket(const string &bucket) {
  boost::lock_guard<boost::mutex> lock(m_bucketsLock);
  BucketMap::iterator it = m_buckets.find(bucket);
  if (it != m_buckets.end()) {
    return it->second;
  }
  shared_ptr<Bucket> qsBucket(new Bucket(*m_qsConfig, bucket, m_zone));
  m_buckets[bucket] = qsBucket;
  return qsBucket;
}

// --------------------------------------------------------------------------
ListObjectsOutcome QSClientImpl::ListObjects(const string &bucket,
                                             ListObjectsInput *input) {
  string exceptionName = "QingStorListObjects bucket=" + bucket;
  if (bucket.empty() || input == NULL) {
    return ListObjectsOutcome(MakeStoreError(
        StoreError::PARAMETER_MISSING, exceptionName,
        "Empty bucket or null ListObjectsInput"));
  }
  exceptionName.append(" prefix=");
  exceptionName.append(input->GetPrefix());

  if (input->GetLimit() <= 0) {
    return ListObjectsOutcome(
        MakeStoreError(StoreError::INVALID_ARGUMENT, exceptionName,
                       "ListObjectsInput with negative or zero count limit"));
  }

  shared_ptr<Bucket> qsBucket = GetBucket(bucket);
  vector<ListObjectsOutput> result;
  bool responseTruncated = true;
  do {
    ListObjectsOutput output;
    QsError sdkErr = qsBucket->ListObjects(*input, output);

    HttpResponseCode responseCode = output.GetResponseCode();
    if (!SDKResponseSuccess(sdkErr, responseCode)) {
      return ListObjectsOutcome(
          BuildStoreError(sdkErr, exceptionName, output));
    }
    responseTruncated = !output.GetNextMarker().empty();
    if (responseTruncated) {
      input->SetMarker(output.GetNextMarker());
    }
    result.push_back(output);
  } while (responseTruncated);

  return ListObjectsOutcome(result);
}

// --------------------------------------------------------------------------
GetObjectOutcome QSClientImpl::GetObject(const string &bucket,
                                         const string &objKey,
                                         GetObjectInput *input) {
  string exceptionName = DescribeObject("QingStorGetObject", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return GetObjectOutcome(err);
  }

  GetObjectOutput output;
  QsError sdkErr = GetBucket(bucket)->GetObject(objKey, *input, output);
  GetObjectOutcome outcome = MakeOutcome(sdkErr, exceptionName, output);
  if (outcome.IsSuccess() && !input->GetRange().empty() &&
      output.GetResponseCode() != QingStor::Http::PARTIAL_CONTENT) {
    // a ranged request must be answered with 206 (Partial Content)
    Warning("Request for " + input->GetRange() +
            ", but response is not 206 (Partial Content)");
    return GetObjectOutcome(MakeStoreError(
        StoreError::SHORT_READ, exceptionName,
        "Expect partial content for " + input->GetRange()));
  }
  return outcome;
}

// --------------------------------------------------------------------------
HeadObjectOutcome QSClientImpl::HeadObject(const string &bucket,
                                           const string &objKey,
                                           HeadObjectInput *input) {
  string exceptionName = DescribeObject("QingStorHeadObject", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return HeadObjectOutcome(err);
  }

  HeadObjectOutput output;
  QsError sdkErr = GetBucket(bucket)->HeadObject(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
PutObjectOutcome QSClientImpl::PutObject(const string &bucket,
                                         const string &objKey,
                                         PutObjectInput *input) {
  string exceptionName = DescribeObject("QingStorPutObject", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return PutObjectOutcome(err);
  }

  PutObjectOutput output;
  QsError sdkErr = GetBucket(bucket)->PutObject(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
InitiateMultipartUploadOutcome QSClientImpl::InitiateMultipartUpload(
    const string &bucket, const string &objKey,
    InitiateMultipartUploadInput *input) {
  string exceptionName =
      DescribeObject("QingStorInitiateMultipartUpload", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return InitiateMultipartUploadOutcome(err);
  }

  InitiateMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->InitiateMultipartUpload(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
UploadMultipartOutcome QSClientImpl::UploadMultipart(
    const string &bucket, const string &objKey, UploadMultipartInput *input) {
  string exceptionName =
      DescribeObject("QingStorUploadMultipart", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return UploadMultipartOutcome(err);
  }

  UploadMultipartOutput output;
  QsError sdkErr = GetBucket(bucket)->UploadMultipart(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
CompleteMultipartUploadOutcome QSClientImpl::CompleteMultipartUpload(
    const string &bucket, const string &objKey,
    CompleteMultipartUploadInput *input) {
  string exceptionName =
      DescribeObject("QingStorCompleteMultipartUpload", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return CompleteMultipartUploadOutcome(err);
  }

  CompleteMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->CompleteMultipartUpload(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
AbortMultipartUploadOutcome QSClientImpl::AbortMultipartUpload(
    const string &bucket, const string &objKey,
    AbortMultipartUploadInput *input) {
  string exceptionName =
      DescribeObject("QingStorAbortMultipartUpload", bucket, objKey);
  StoreClientError err = CheckRequest(exceptionName, bucket, objKey, input);
  if (!IsGoodStoreError(err)) {
    return AbortMultipartUploadOutcome(err);
  }

  AbortMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->AbortMultipartUpload(objKey, *input, output);
  return MakeOutcome(sdkErr, exceptionName, output);
}

}  // namespace Client
}  // namespace QSX
