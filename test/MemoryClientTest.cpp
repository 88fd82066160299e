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

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "client/MemoryClient.h"

namespace QSX {

namespace Client {

using std::string;
using std::vector;
using ::testing::Test;

static const char *bucket = "bucket";

vector<char> Bytes(const string &str) {
  return vector<char>(str.begin(), str.end());
}

class MemoryClientTest : public Test {
 protected:
  MemoryClient m_client;
};

TEST_F(MemoryClientTest, PutGetHead) {
  ASSERT_TRUE(IsGoodStoreError(m_client.PutObject(bucket, "k", Bytes("hello"))));
  EXPECT_TRUE(m_client.HasObject(bucket, "k"));

  vector<char> buffer;
  ASSERT_TRUE(IsGoodStoreError(m_client.GetObject(bucket, "k", 0, 0, &buffer)));
  EXPECT_EQ(buffer, Bytes("hello"));

  ASSERT_TRUE(IsGoodStoreError(m_client.GetObject(bucket, "k", 1, 3, &buffer)));
  EXPECT_EQ(buffer, Bytes("ell"));

  // range running past the end is cut
  ASSERT_TRUE(IsGoodStoreError(m_client.GetObject(bucket, "k", 3, 9, &buffer)));
  EXPECT_EQ(buffer, Bytes("lo"));

  EXPECT_EQ(m_client.GetObject(bucket, "k", 5, 1, &buffer).GetError(),
            StoreError::INVALID_ARGUMENT);

  uint64_t size = 0;
  ASSERT_TRUE(IsGoodStoreError(m_client.HeadObject(bucket, "k", &size)));
  EXPECT_EQ(size, 5u);
  EXPECT_EQ(m_client.GetRequestCount("GetObject"), 4u);
  EXPECT_EQ(m_client.GetTotalRequestCount(), 6u);
}

TEST_F(MemoryClientTest, Missing) {
  vector<char> buffer;
  uint64_t size = 0;
  StoreClientError err = m_client.GetObject(bucket, "none", 0, 0, &buffer);
  EXPECT_EQ(err.GetError(), StoreError::NOT_FOUND);
  EXPECT_FALSE(err.ShouldRetry());
  EXPECT_EQ(m_client.HeadObject(bucket, "none", &size).GetError(),
            StoreError::NOT_FOUND);
  EXPECT_EQ(m_client.PutObject(bucket, "", Bytes("x")).GetError(),
            StoreError::PARAMETER_MISSING);
}

TEST_F(MemoryClientTest, MultipartUpload) {
  string uploadId;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.InitiateMultipartUpload(bucket, "mp", &uploadId)));
  EXPECT_FALSE(uploadId.empty());
  EXPECT_EQ(m_client.GetOpenUploadCount(), 1u);

  vector<CompletedPart> parts(2);
  // parts may arrive in any order
  ASSERT_TRUE(IsGoodStoreError(m_client.UploadMultipart(
      bucket, "mp", uploadId, 2, Bytes("world"), &parts[1].partTag)));
  ASSERT_TRUE(IsGoodStoreError(m_client.UploadMultipart(
      bucket, "mp", uploadId, 1, Bytes("hello "), &parts[0].partTag)));
  parts[0].partNumber = 1;
  parts[1].partNumber = 2;
  EXPECT_FALSE(m_client.HasObject(bucket, "mp"));

  ASSERT_TRUE(IsGoodStoreError(
      m_client.CompleteMultipartUpload(bucket, "mp", uploadId, parts)));
  EXPECT_EQ(m_client.GetStoredObject(bucket, "mp"), Bytes("hello world"));
  EXPECT_EQ(m_client.GetOpenUploadCount(), 0u);
  EXPECT_EQ(m_client.GetLastCompletedParts().size(), 2u);

  // a finished session is gone
  EXPECT_EQ(m_client.AbortMultipartUpload(bucket, "mp", uploadId).GetError(),
            StoreError::NO_SUCH_UPLOAD);
}

TEST_F(MemoryClientTest, CompleteRejectsBadPartList) {
  string uploadId;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.InitiateMultipartUpload(bucket, "mp", &uploadId)));
  string tag;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.UploadMultipart(bucket, "mp", uploadId, 1, Bytes("a"), &tag)));
  ASSERT_TRUE(IsGoodStoreError(
      m_client.UploadMultipart(bucket, "mp", uploadId, 2, Bytes("b"), &tag)));

  vector<CompletedPart> unsorted;
  unsorted.push_back(CompletedPart(2, "t2"));
  unsorted.push_back(CompletedPart(1, "t1"));
  EXPECT_FALSE(IsGoodStoreError(
      m_client.CompleteMultipartUpload(bucket, "mp", uploadId, unsorted)));

  vector<CompletedPart> unknown;
  unknown.push_back(CompletedPart(1, "t1"));
  unknown.push_back(CompletedPart(3, "t3"));
  EXPECT_FALSE(IsGoodStoreError(
      m_client.CompleteMultipartUpload(bucket, "mp", uploadId, unknown)));
  EXPECT_FALSE(m_client.HasObject(bucket, "mp"));

  EXPECT_EQ(m_client.CompleteMultipartUpload(bucket, "other", uploadId,
                                             vector<CompletedPart>())
                .GetError(),
            StoreError::NO_SUCH_UPLOAD);
}

TEST_F(MemoryClientTest, CompleteChecksPartTags) {
  string uploadId;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.InitiateMultipartUpload(bucket, "mp", &uploadId)));
  string firstTag;
  ASSERT_TRUE(IsGoodStoreError(m_client.UploadMultipart(
      bucket, "mp", uploadId, 1, Bytes("ab"), &firstTag)));
  string tag;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.UploadMultipart(bucket, "mp", uploadId, 1, Bytes("a"), &tag)));
  EXPECT_NE(tag, firstTag);

  vector<CompletedPart> parts;
  parts.push_back(CompletedPart(1, ""));
  EXPECT_EQ(m_client.CompleteMultipartUpload(bucket, "mp", uploadId, parts)
                .GetError(),
            StoreError::INVALID_ARGUMENT);
  // the tag of a replaced part is stale
  parts[0].partTag = firstTag;
  EXPECT_EQ(m_client.CompleteMultipartUpload(bucket, "mp", uploadId, parts)
                .GetError(),
            StoreError::INVALID_ARGUMENT);
  EXPECT_FALSE(m_client.HasObject(bucket, "mp"));

  parts[0].partTag = tag;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.CompleteMultipartUpload(bucket, "mp", uploadId, parts)));
  EXPECT_EQ(m_client.GetStoredObject(bucket, "mp"), Bytes("a"));
}

TEST_F(MemoryClientTest, AbortMultipartUpload) {
  string uploadId;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.InitiateMultipartUpload(bucket, "mp", &uploadId)));
  string tag;
  ASSERT_TRUE(IsGoodStoreError(
      m_client.UploadMultipart(bucket, "mp", uploadId, 1, Bytes("a"), &tag)));
  ASSERT_TRUE(
      IsGoodStoreError(m_client.AbortMultipartUpload(bucket, "mp", uploadId)));
  EXPECT_EQ(m_client.GetOpenUploadCount(), 0u);
  ASSERT_EQ(m_client.GetAbortedUploads().size(), 1u);
  EXPECT_EQ(m_client.GetAbortedUploads()[0], uploadId);
  EXPECT_EQ(
      m_client.UploadMultipart(bucket, "mp", uploadId, 2, Bytes("b"), &tag)
          .GetError(),
      StoreError::NO_SUCH_UPLOAD);
}

TEST_F(MemoryClientTest, ListObjects) {
  ASSERT_TRUE(IsGoodStoreError(m_client.PutObject(bucket, "a/1", Bytes("1"))));
  ASSERT_TRUE(IsGoodStoreError(m_client.PutObject(bucket, "a/22", Bytes("22"))));
  ASSERT_TRUE(IsGoodStoreError(m_client.PutObject(bucket, "b/3", Bytes("3"))));

  vector<ObjectSummary> summaries;
  ASSERT_TRUE(IsGoodStoreError(m_client.ListObjects(bucket, "a/", &summaries)));
  ASSERT_EQ(summaries.size(), 2u);
  EXPECT_EQ(summaries[0].key, "a/1");
  EXPECT_EQ(summaries[1].key, "a/22");
  EXPECT_EQ(summaries[1].size, 2u);

  ASSERT_TRUE(IsGoodStoreError(m_client.ListObjects(bucket, "", &summaries)));
  EXPECT_EQ(summaries.size(), 3u);
  ASSERT_TRUE(IsGoodStoreError(m_client.ListObjects("none", "", &summaries)));
  EXPECT_TRUE(summaries.empty());
}

}  // namespace Client
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
