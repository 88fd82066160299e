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

#include "client/QSClient.h"

#include <stdint.h>  // for uint64_t

#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QingStor.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsSdkOption.h"
#include "qingstor/types/KeyType.h"
#include "qingstor/types/ObjectPartType.h"

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/QSClientImpl.h"
#include "client/QSClientOutcome.h"
#include "configure/Default.h"

namespace QSX {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using QingStor::AbortMultipartUploadInput;
using QingStor::CompleteMultipartUploadInput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::ListObjectsInput;
using QingStor::ListObjectsOutput;
using QingStor::PutObjectInput;
using QingStor::QsConfig;  // sdk config
using QingStor::UploadMultipartInput;
using QSX::StringUtils::FormatByteRange;
using std::iostream;
using std::string;
using std::stringstream;
using std::vector;

namespace {

boost::mutex serviceLock;
int serviceUsers = 0;
QingStor::SDKOptions sdkOptions;
shared_ptr<QsConfig> qingStorConfig;

StoreClientError Good() { return StoreClientError(StoreError::GOOD, false); }

LogLevel ToSDKLogLevel(ClientLogLevel::Value level) {
  switch (level) {
    case ClientLogLevel::Verbose:
      return Verbose;
    case ClientLogLevel::Debug:
      return Debug;
    case ClientLogLevel::Info:
      return Info;
    case ClientLogLevel::Error:
      return Error;
    case ClientLogLevel::Fatal:
      return Fatal;
    default:
      return Warning;
  }
}

}  // namespace

// --------------------------------------------------------------------------
QSClient::QSClient(const ClientConfiguration &config,
                   const RetryStrategy &retryStrategy)
    : Client(retryStrategy),
      m_impl(new QSClientImpl(StartQSService(config), config.GetZone())) {}

// --------------------------------------------------------------------------
QSClient::~QSClient() {
  m_impl.reset();
  CloseQSService();
}

// --------------------------------------------------------------------------
shared_ptr<QsConfig> QSClient::StartQSService(
    const ClientConfiguration &config) {
  boost::lock_guard<boost::mutex> lock(serviceLock);
  if (serviceUsers++ > 0) {
    return qingStorConfig;
  }

  sdkOptions.logLevel = ToSDKLogLevel(config.GetClientLogLevel());
  sdkOptions.logPath = config.GetClientLogDirectory();
  InitializeSDK(sdkOptions);

  qingStorConfig = shared_ptr<QsConfig>(
      new QsConfig(config.GetAccessKeyId(), config.GetSecretKey()));
  qingStorConfig->additionalUserAgent = config.GetAdditionalAgent();
  qingStorConfig->host = config.GetHost();
  qingStorConfig->protocol = config.GetProtocol();
  qingStorConfig->port = config.GetPort();
  qingStorConfig->connectionRetries = config.GetTransactionRetries();
  // timeOutPeriod is for one connection
  qingStorConfig->timeOutPeriod = config.GetTransactionTimeDuration();
  return qingStorConfig;
}

// --------------------------------------------------------------------------
void QSClient::CloseQSService() {
  boost::lock_guard<boost::mutex> lock(serviceLock);
  if (serviceUsers > 0 && --serviceUsers == 0) {
    qingStorConfig.reset();
    ShutdownSDK(sdkOptions);
  }
}

// --------------------------------------------------------------------------
StoreClientError QSClient::GetObject(const string &bucket, const string &key,
                                     uint64_t offset, uint64_t length,
                                     vector<char> *buffer) {
  GetObjectInput input;
  if (length > 0) {
    input.SetRange(FormatByteRange(offset, length));
  }

  GetObjectOutcome outcome = m_impl->GetObject(bucket, key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }

  GetObjectOutput &res = outcome.GetResult();
  iostream *bodyStream = res.GetBody();
  if (buffer != NULL) {
    buffer->clear();
    if (bodyStream != NULL) {
      bodyStream->seekg(0, std::ios_base::beg);
      buffer->assign(std::istreambuf_iterator<char>(*bodyStream),
                     std::istreambuf_iterator<char>());
    }
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::PutObject(const string &bucket, const string &key,
                                     const vector<char> &body) {
  PutObjectInput input;
  input.SetContentLength(body.size());
  shared_ptr<stringstream> ss(new stringstream);
  if (!body.empty()) {
    ss->write(&body[0], body.size());
    input.SetBody(ss.get());
  }

  PutObjectOutcome outcome = m_impl->PutObject(bucket, key, &input);
  return outcome.IsSuccess() ? Good() : outcome.GetError();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::InitiateMultipartUpload(const string &bucket,
                                                   const string &key,
                                                   string *uploadId) {
  InitiateMultipartUploadInput input;
  InitiateMultipartUploadOutcome outcome =
      m_impl->InitiateMultipartUpload(bucket, key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (uploadId != NULL) {
    *uploadId = outcome.GetResult().GetUploadID();
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::UploadMultipart(const string &bucket,
                                           const string &key,
                                           const string &uploadId,
                                           int partNumber,
                                           const vector<char> &body,
                                           string *partTag) {
  UploadMultipartInput input;
  input.SetUploadID(uploadId);
  input.SetPartNumber(partNumber);
  input.SetContentLength(body.size());
  shared_ptr<stringstream> ss(new stringstream);
  if (!body.empty()) {
    ss->write(&body[0], body.size());
    input.SetBody(ss.get());
  }

  UploadMultipartOutcome outcome = m_impl->UploadMultipart(bucket, key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (partTag != NULL) {
    *partTag = to_string(partNumber);
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::CompleteMultipartUpload(
    const string &bucket, const string &key, const string &uploadId,
    const vector<CompletedPart> &sortedParts) {
  CompleteMultipartUploadInput input;
  input.SetUploadID(uploadId);
  vector<ObjectPartType> objParts;
  BOOST_FOREACH(const CompletedPart &completed, sortedParts) {
    ObjectPartType part;
    part.SetPartNumber(completed.partNumber);
    objParts.push_back(part);
  }
  input.SetObjectParts(objParts);

  CompleteMultipartUploadOutcome outcome =
      m_impl->CompleteMultipartUpload(bucket, key, &input);
  return outcome.IsSuccess() ? Good() : outcome.GetError();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::AbortMultipartUpload(const string &bucket,
                                                const string &key,
                                                const string &uploadId) {
  AbortMultipartUploadInput input;
  input.SetUploadID(uploadId);
  AbortMultipartUploadOutcome outcome =
      m_impl->AbortMultipartUpload(bucket, key, &input);
  return outcome.IsSuccess() ? Good() : outcome.GetError();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::HeadObject(const string &bucket, const string &key,
                                      uint64_t *size) {
  HeadObjectInput input;
  HeadObjectOutcome outcome = m_impl->HeadObject(bucket, key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (size != NULL) {
    *size = static_cast<uint64_t>(outcome.GetResult().GetContentLength());
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError QSClient::ListObjects(const string &bucket,
                                       const string &prefix,
                                       vector<ObjectSummary> *summaries) {
  ListObjectsInput input;
  input.SetLimit(QSX::Configure::Default::GetMaxListObjectsCount());
  if (!prefix.empty()) {
    input.SetPrefix(prefix);
  }

  ListObjectsOutcome outcome = m_impl->ListObjects(bucket, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (summaries != NULL) {
    summaries->clear();
    BOOST_FOREACH(ListObjectsOutput &page, outcome.GetResult()) {
      BOOST_FOREACH(const KeyType &key, page.GetKeys()) {
        KeyType &k = const_cast<KeyType &>(key);
        summaries->push_back(
            ObjectSummary(k.GetKey(), static_cast<uint64_t>(k.GetSize())));
      }
    }
  }
  return Good();
}

}  // namespace Client
}  // namespace QSX
