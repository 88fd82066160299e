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

#include <stdint.h>

#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/Utils.h"
#include "client/ChunkPlanner.h"
#include "client/MemoryClient.h"
#include "client/RetryStrategy.h"
#include "client/TransferWorker.h"

namespace QSX {

namespace Client {

using boost::shared_ptr;
using std::map;
using std::string;
using std::vector;
using ::testing::Test;

static const char *sourceFile = "/tmp/qsxfer.test.worker.source";
static const char *bucket = "bucket";
static const char *objKey = "key";

// MemoryClient failing the first calls of a part or a range with a scripted
// error.
class FlakyClient : public MemoryClient {
 public:
  FlakyClient()
      : MemoryClient(), m_failures(0), m_error(StoreError::SERVER_ERROR),
        m_shortReads(0), m_throw(false) {}

  void FailTimes(int times, StoreError::Value error) {
    m_failures = times;
    m_error = error;
  }
  void ShortReadTimes(int times) { m_shortReads = times; }
  void ThrowOnCall() { m_throw = true; }

  int GetCalls(uint64_t id) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_calls[id];
  }

  StoreClientError UploadMultipart(const string &bucket, const string &key,
                                   const string &uploadId, int partNumber,
                                   const vector<char> &body, string *partTag) {
    if (ShouldFail(partNumber)) {
      return MakeStoreError(m_error, "FlakyUploadMultipart", "");
    }
    return MemoryClient::UploadMultipart(bucket, key, uploadId, partNumber,
                                         body, partTag);
  }

  StoreClientError GetObject(const string &bucket, const string &key,
                             uint64_t offset, uint64_t length,
                             vector<char> *buffer) {
    int call = 0;
    if (ShouldFail(offset, &call)) {
      return MakeStoreError(m_error, "FlakyGetObject", "");
    }
    StoreClientError err =
        MemoryClient::GetObject(bucket, key, offset, length, buffer);
    if (call <= m_shortReads && !buffer->empty()) {
      buffer->pop_back();
    }
    return err;
  }

 private:
  bool ShouldFail(uint64_t id, int *callOut = NULL) {
    if (m_throw) {
      throw std::runtime_error("connection reset");
    }
    boost::lock_guard<boost::mutex> locker(m_lock);
    int call = ++m_calls[id];
    if (callOut != NULL) {
      *callOut = call - m_failures;
    }
    return call <= m_failures;
  }

  boost::mutex m_lock;
  map<uint64_t, int> m_calls;
  int m_failures;
  StoreError::Value m_error;
  int m_shortReads;
  bool m_throw;
};

class TransferWorkerTest : public Test {
 protected:
  static void SetUpTestCase() {
    std::ofstream file(sourceFile, std::ios_base::binary | std::ios_base::trunc);
    for (int i = 0; i < 100; ++i) {
      file.put(static_cast<char>(i));
    }
  }

  static void TearDownTestCase() { QSX::Utils::RemoveFileIfExists(sourceFile); }

  void SetUp() {
    m_client = boost::make_shared<FlakyClient>();
    ASSERT_TRUE(IsGoodStoreError(
        m_client->InitiateMultipartUpload(bucket, objKey, &m_uploadId)));
    m_target.localPath = sourceFile;
    m_target.bucket = bucket;
    m_target.key = objKey;
    m_target.uploadId = m_uploadId;
  }

  UploadTarget m_target;
  string m_uploadId;
  shared_ptr<FlakyClient> m_client;
};

TEST_F(TransferWorkerTest, UploadFirstAttempt) {
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(2, 20, 10));
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.index, 2u);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_FALSE(outcome.partTag.empty());
  EXPECT_EQ(m_client->GetRequestCount("UploadMultipart"), 1u);
}

TEST_F(TransferWorkerTest, UploadSucceedsAfterMaxMinusOneFailures) {
  m_client->FailTimes(4, StoreError::SERVER_ERROR);
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(0, 0, 10));
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.attempts, 5);
  EXPECT_EQ(m_client->GetCalls(1), 5);
  EXPECT_FALSE(outcome.partTag.empty());
}

TEST_F(TransferWorkerTest, UploadFailsAfterMaxFailures) {
  m_client->FailTimes(5, StoreError::REQUEST_TIMEOUT);
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 5);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::REQUEST_TIMEOUT);
  EXPECT_TRUE(outcome.partTag.empty());
  EXPECT_EQ(m_client->GetCalls(1), 5);
}

TEST_F(TransferWorkerTest, UploadPermanentErrorNotRetried) {
  m_client->FailTimes(3, StoreError::ACCESS_DENIED);
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::ACCESS_DENIED);
}

TEST_F(TransferWorkerTest, UploadClientExceptionIsFailure) {
  m_client->ThrowOnCall();
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::UNKNOWN);
}

TEST_F(TransferWorkerTest, UploadLocalReadFailure) {
  UploadTarget target = m_target;
  target.localPath = "/tmp/qsxfer.test.worker.no.such.file";
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Upload(target, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 0);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::LOCAL_IO_ERROR);
  EXPECT_EQ(m_client->GetRequestCount("UploadMultipart"), 0u);

  // range past end of file
  outcome = worker.Upload(m_target, ChunkRange(0, 95, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::LOCAL_IO_ERROR);
}

TEST_F(TransferWorkerTest, UploadSendsExactRange) {
  TransferWorker worker(m_client, RetryStrategy(1, 0));
  ChunkOutcome outcome = worker.Upload(m_target, ChunkRange(0, 30, 5));
  ASSERT_TRUE(outcome.success);
  EXPECT_FALSE(outcome.partTag.empty());
  vector<CompletedPart> parts;
  parts.push_back(CompletedPart(1, outcome.partTag));
  ASSERT_TRUE(IsGoodStoreError(m_client->CompleteMultipartUpload(
      bucket, objKey, m_uploadId, parts)));

  vector<char> stored = m_client->GetStoredObject(bucket, objKey);
  ASSERT_EQ(stored.size(), 5u);
  for (size_t i = 0; i < stored.size(); ++i) {
    EXPECT_EQ(stored[i], static_cast<char>(30 + i));
  }
}

TEST_F(TransferWorkerTest, DownloadRange) {
  vector<char> data(50);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(i * 3);
  }
  ASSERT_TRUE(IsGoodStoreError(m_client->PutObject(bucket, "obj", data)));

  DownloadSource source;
  source.bucket = bucket;
  source.key = "obj";
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Download(source, ChunkRange(1, 10, 10));
  ASSERT_TRUE(outcome.success);
  ASSERT_TRUE(outcome.bytes);
  EXPECT_EQ(*outcome.bytes, vector<char>(data.begin() + 10, data.begin() + 20));
  EXPECT_EQ(outcome.attempts, 1);
}

TEST_F(TransferWorkerTest, DownloadShortReadIsRetried) {
  vector<char> data(50, 'x');
  ASSERT_TRUE(IsGoodStoreError(m_client->PutObject(bucket, "obj", data)));
  m_client->ShortReadTimes(2);

  DownloadSource source;
  source.bucket = bucket;
  source.key = "obj";
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Download(source, ChunkRange(0, 0, 10));
  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.attempts, 3);
  EXPECT_EQ(outcome.bytes->size(), 10u);

  // runs out of attempts
  m_client = boost::make_shared<FlakyClient>();
  ASSERT_TRUE(IsGoodStoreError(m_client->PutObject(bucket, "obj", data)));
  m_client->ShortReadTimes(3);
  TransferWorker worker2(m_client, RetryStrategy(3, 0));
  outcome = worker2.Download(source, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 3);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::SHORT_READ);
  EXPECT_FALSE(outcome.bytes);
}

TEST_F(TransferWorkerTest, DownloadKeepsShortLastChunk) {
  vector<char> data(55, 'y');
  ASSERT_TRUE(IsGoodStoreError(m_client->PutObject(bucket, "obj", data)));

  DownloadSource source;
  source.bucket = bucket;
  source.key = "obj";
  source.objectSize = 60;
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Download(source, ChunkRange(5, 50, 10));
  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.bytes->size(), 5u);

  // a short chunk before the declared end is still retried
  outcome = worker.Download(source, ChunkRange(4, 40, 10));
  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.attempts, 1);
  m_client->ShortReadTimes(10);
  outcome = worker.Download(source, ChunkRange(4, 40, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 5);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::SHORT_READ);
}

TEST_F(TransferWorkerTest, DownloadMissingObject) {
  DownloadSource source;
  source.bucket = bucket;
  source.key = "missing";
  TransferWorker worker(m_client, RetryStrategy(5, 0));
  ChunkOutcome outcome = worker.Download(source, ChunkRange(0, 0, 10));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.cause.GetError(), StoreError::NOT_FOUND);
}

}  // namespace Client
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
