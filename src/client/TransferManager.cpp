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

#include "client/TransferManager.h"

#include <errno.h>
#include <string.h>

#include <exception>
#include <fstream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/ConcurrencyGate.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/Client.h"
#include "client/ResultAggregator.h"
#include "client/RetryLoop.h"
#include "client/TransferHandle.h"
#include "client/TransferWorker.h"

namespace QSX {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using QSX::StringUtils::FormatObject;
using QSX::StringUtils::FormatPath;
using QSX::Threading::ConcurrencyGate;
using QSX::Threading::PermitPtr;
using QSX::Threading::ThreadPool;
using std::ofstream;
using std::pair;
using std::string;

namespace {

// Run the work of one chunk, an escaped exception fails the chunk
ChunkOutcome RunChunk(const boost::function<ChunkOutcome(const ChunkRange &)>
                          &work,
                      const ChunkRange &range) {
  try {
    return work(range);
  } catch (const std::exception &err) {
    ChunkOutcome outcome;
    outcome.index = range.index;
    outcome.cause = StoreClientError(StoreError::UNKNOWN, "RunChunk",
                                     err.what(), false);
    return outcome;
  }
}

// Record the outcome before giving the slot back, so the dispatcher sees a
// failure before it can get another permit
void OnChunkDone(const PermitPtr &permit,
                 const shared_ptr<ResultAggregator> &aggregator,
                 const ChunkOutcome &outcome) {
  aggregator->Add(outcome);
  permit->Release();
}

TransferClientError MakeTransferError(TransferError::Value err,
                                      const string &exceptionName,
                                      const string &message) {
  return TransferClientError(err, exceptionName, message, false);
}

}  // namespace

// --------------------------------------------------------------------------
TransferManager::TransferManager(const shared_ptr<Client> &client,
                                 const TransferManagerConfigure &config)
    : m_configure(config),
      m_client(client),
      m_executor(boost::make_shared<ThreadPool>(config.m_workerBudget)) {}

// --------------------------------------------------------------------------
TransferManager::~TransferManager() {
  // joins the workers
  m_executor.reset();
}

// --------------------------------------------------------------------------
RetryStrategy TransferManager::GetChunkRetryStrategy() const {
  return RetryStrategy(m_configure.m_maxRetriesPerChunk,
                       m_configure.m_retryScaleFactor);
}

// --------------------------------------------------------------------------
bool TransferManager::Plan(const shared_ptr<TransferHandle> &handle,
                           uint64_t size, ChunkRangeList *ranges) {
  ChunkPlanOutcome plan =
      PlanChunks(size, m_configure.m_chunkSize, m_configure.m_maxChunks);
  if (!plan.IsSuccess()) {
    Error("Unable to plan " << handle->ToString() << " "
                            << GetMessageForTransferError(plan.GetError()));
    handle->Fail(plan.GetError());
    return false;
  }
  ranges->swap(plan.GetResult());
  handle->SetChunkCount(ranges->size());
  DebugInfo("Planned " << ranges->size() << " chunks of "
                       << m_configure.m_chunkSize << " bytes for "
                       << FormatObject(handle->GetBucket(),
                                       handle->GetObjectKey()));
  return true;
}

// --------------------------------------------------------------------------
bool TransferManager::DispatchAndAggregate(
    const shared_ptr<TransferHandle> &handle, const ChunkRangeList &ranges,
    const ChunkWork &work, const shared_ptr<ResultAggregator> &aggregator) {
  handle->UpdateState(TransferState::Dispatching);

  // gate lives as long as this transfer and its outstanding permits
  shared_ptr<ConcurrencyGate> gate =
      ConcurrencyGate::Create(m_configure.m_workerBudget);
  ChunkWork guarded = boost::bind(&RunChunk, work, _1);

  size_t dispatched = 0;
  BOOST_FOREACH(const ChunkRange &range, ranges) {
    if (!aggregator->ShouldContinue()) {
      break;
    }
    PermitPtr permit = gate->Acquire();
    if (!aggregator->ShouldContinue()) {
      break;
    }
    m_executor->SubmitAsync(
        boost::bind(&OnChunkDone, permit, aggregator, _1), guarded, range);
    ++dispatched;
  }

  handle->UpdateState(TransferState::Aggregating);
  aggregator->WaitUntilDrained(dispatched);
  handle->SetPeakConcurrency(gate->GetPeakInUse());

  if (aggregator->IsComplete()) {
    return true;
  }

  boost::optional<ChunkOutcome> failure = aggregator->GetFirstFailure();
  if (failure) {
    handle->SetFailedChunk(failure->index, failure->attempts);
    Error("Chunk " << failure->index << " of " << handle->ToString()
                   << " failed after " << failure->attempts << " attempts");
    handle->Fail(
        MakeTransferError(TransferError::CHUNK_FAILED, "TransferChunk",
                          "Chunk " + to_string(failure->index) +
                              " failed after " +
                              to_string(failure->attempts) + " attempts"),
        failure->cause);
  } else {
    handle->Fail(MakeTransferError(
        TransferError::CHUNK_FAILED, "TransferChunk",
        "Only " + to_string(aggregator->GetReceivedCount()) + " of " +
            to_string(ranges.size()) + " chunks arrived"));
  }
  return false;
}

// --------------------------------------------------------------------------
void TransferManager::AbortUpload(const shared_ptr<TransferHandle> &handle) {
  if (handle->GetUploadId().empty()) {
    return;
  }
  RetryLoop loop(*m_client, GetChunkRetryStrategy());
  StoreClientError err = loop.Run(
      boost::bind(&Client::AbortMultipartUpload, m_client.get(),
                  handle->GetBucket(), handle->GetObjectKey(),
                  handle->GetUploadId()),
      "AbortMultipartUpload");
  if (IsGoodStoreError(err)) {
    Info("Aborted multipart upload " << handle->GetUploadId() << " of "
                                     << FormatObject(handle->GetBucket(),
                                                     handle->GetObjectKey()));
  } else {
    Warning("Unable to abort multipart upload "
            << handle->GetUploadId() << " " << GetMessageForStoreError(err));
  }
}

// --------------------------------------------------------------------------
void TransferManager::Complete(const shared_ptr<TransferHandle> &handle) {
  handle->UpdateState(TransferState::Completed);
  Info(handle->ToString());
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::UploadFile(const string &filePath,
                                                       const string &bucket,
                                                       const string &objKey,
                                                       uint64_t fileSize) {
  shared_ptr<TransferHandle> handle = boost::make_shared<TransferHandle>(
      bucket, objKey, TransferDirection::Upload, filePath);

  // Planning
  if (fileSize == 0) {
    pair<bool, uint64_t> res = QSX::Utils::GetFileSize(filePath);
    if (!res.first) {
      handle->Fail(MakeTransferError(
          TransferError::LOCAL_IO_ERROR, "UploadFile",
          "Unable to get size of " + FormatPath(filePath) + " " +
              strerror(errno)));
      Error(handle->ToString());
      return handle;
    }
    fileSize = res.second;
  }
  handle->SetExpectedSize(fileSize);

  ChunkRangeList ranges;
  if (!Plan(handle, fileSize, &ranges)) {
    return handle;
  }

  RetryLoop sessionLoop(*m_client, GetChunkRetryStrategy());
  string uploadId;
  StoreClientError err = sessionLoop.Run(
      boost::bind(&Client::InitiateMultipartUpload, m_client.get(), bucket,
                  objKey, &uploadId),
      "InitiateMultipartUpload");
  if (!IsGoodStoreError(err)) {
    handle->Fail(MakeTransferError(TransferError::SESSION_ERROR,
                                   "InitiateMultipartUpload",
                                   "Unable to open multipart session"),
                 err);
    Error(handle->ToString());
    return handle;
  }
  handle->SetUploadId(uploadId);
  Info("Opened multipart upload " << uploadId << " of "
                                  << FormatObject(bucket, objKey) << " for "
                                  << ranges.size() << " parts");

  // Dispatching and Aggregating
  UploadTarget target;
  target.localPath = filePath;
  target.bucket = bucket;
  target.key = objKey;
  target.uploadId = uploadId;
  shared_ptr<TransferWorker> worker =
      boost::make_shared<TransferWorker>(m_client, GetChunkRetryStrategy());
  shared_ptr<ResultAggregator> aggregator =
      boost::make_shared<ResultAggregator>(ranges.size());
  ChunkWork work = boost::bind(&TransferWorker::Upload, worker, target, _1);
  if (!DispatchAndAggregate(handle, ranges, work, aggregator)) {
    AbortUpload(handle);
    return handle;
  }

  // Finalizing
  handle->UpdateState(TransferState::Finalizing);
  handle->SetCompletedParts(aggregator->GetSortedParts());
  err = sessionLoop.Run(
      boost::bind(&Client::CompleteMultipartUpload, m_client.get(), bucket,
                  objKey, uploadId, boost::cref(handle->GetCompletedParts())),
      "CompleteMultipartUpload");
  if (!IsGoodStoreError(err)) {
    handle->Fail(MakeTransferError(TransferError::SESSION_ERROR,
                                   "CompleteMultipartUpload",
                                   "Unable to commit multipart session"),
                 err);
    Error(handle->ToString());
    AbortUpload(handle);
    return handle;
  }
  Info("Completed multipart upload " << uploadId << " of "
                                     << FormatObject(bucket, objKey));

  uint64_t actualSize = 0;
  err = sessionLoop.Run(boost::bind(&Client::HeadObject, m_client.get(),
                                    bucket, objKey, &actualSize),
                        "HeadObject");
  if (!IsGoodStoreError(err)) {
    handle->Fail(MakeTransferError(TransferError::STORE_ERROR, "HeadObject",
                                   "Unable to verify size of uploaded object"),
                 err);
    Error(handle->ToString());
    return handle;
  }
  handle->SetActualSize(actualSize);
  if (actualSize != fileSize) {
    handle->Fail(MakeTransferError(
        TransferError::INTEGRITY_MISMATCH, "VerifyUpload",
        "Expected " + to_string(fileSize) + " bytes, store reports " +
            to_string(actualSize)));
    Error(handle->ToString());
    return handle;
  }

  Complete(handle);
  return handle;
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::DownloadObject(
    const string &bucket, const string &objKey) {
  return Download(bucket, objKey, string());
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::DownloadFile(
    const string &bucket, const string &objKey, const string &filePath) {
  return Download(bucket, objKey, filePath);
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::Download(const string &bucket,
                                                     const string &objKey,
                                                     const string &filePath) {
  shared_ptr<TransferHandle> handle = boost::make_shared<TransferHandle>(
      bucket, objKey, TransferDirection::Download, filePath);

  // Planning
  uint64_t objectSize = 0;
  RetryLoop headLoop(*m_client, GetChunkRetryStrategy());
  StoreClientError err = headLoop.Run(
      boost::bind(&Client::HeadObject, m_client.get(), bucket, objKey,
                  &objectSize),
      "HeadObject");
  if (!IsGoodStoreError(err)) {
    handle->Fail(MakeTransferError(TransferError::STORE_ERROR, "HeadObject",
                                   "Unable to get size of object"),
                 err);
    Error(handle->ToString());
    return handle;
  }
  handle->SetExpectedSize(objectSize);

  ChunkRangeList ranges;
  if (!Plan(handle, objectSize, &ranges)) {
    return handle;
  }

  // Dispatching and Aggregating
  DownloadSource source;
  source.bucket = bucket;
  source.key = objKey;
  source.objectSize = objectSize;
  shared_ptr<TransferWorker> worker =
      boost::make_shared<TransferWorker>(m_client, GetChunkRetryStrategy());
  shared_ptr<ResultAggregator> aggregator =
      boost::make_shared<ResultAggregator>(ranges.size());
  ChunkWork work =
      boost::bind(&TransferWorker::Download, worker, source, _1);
  if (!DispatchAndAggregate(handle, ranges, work, aggregator)) {
    return handle;
  }

  // Finalizing
  handle->UpdateState(TransferState::Finalizing);
  uint64_t assembledSize = aggregator->GetAssembledSize();
  handle->SetActualSize(assembledSize);
  if (assembledSize != objectSize) {
    handle->Fail(MakeTransferError(
        TransferError::INTEGRITY_MISMATCH, "VerifyDownload",
        "Expected " + to_string(objectSize) + " bytes, assembled " +
            to_string(assembledSize)));
    Error(handle->ToString());
    return handle;
  }

  if (filePath.empty()) {
    aggregator->Assemble().swap(handle->GetMutableData());
  } else {
    ofstream file(filePath.c_str(), std::ios_base::out |
                                        std::ios_base::binary |
                                        std::ios_base::trunc);
    bool written = file && aggregator->WriteTo(file);
    file.close();
    if (!written || !file) {
      handle->Fail(MakeTransferError(
          TransferError::LOCAL_IO_ERROR, "WriteFile",
          "Unable to write " + FormatPath(filePath) + " " + strerror(errno)));
      Error(handle->ToString());
      return handle;
    }
  }
  aggregator.reset();

  Complete(handle);
  return handle;
}

}  // namespace Client
}  // namespace QSX
