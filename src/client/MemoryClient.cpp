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

#include "client/MemoryClient.h"

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"

#include "base/StringUtils.h"

namespace QSX {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using QSX::StringUtils::FormatObject;
using std::map;
using std::string;
using std::vector;

namespace {

StoreClientError Good() { return StoreClientError(StoreError::GOOD, false); }

}  // namespace

// --------------------------------------------------------------------------
MemoryClient::MemoryClient(const RetryStrategy &retryStrategy)
    : Client(retryStrategy), m_nextUploadId(1) {}

// --------------------------------------------------------------------------
void MemoryClient::CountRequest(const string &operation) {
  lock_guard<mutex> lock(m_lock);
  ++m_requestCounts[operation];
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::GetObject(const string &bucket,
                                         const string &key, uint64_t offset,
                                         uint64_t length,
                                         vector<char> *buffer) {
  CountRequest("GetObject");
  lock_guard<mutex> lock(m_lock);
  map<string, ObjectMap>::const_iterator b = m_buckets.find(bucket);
  if (b == m_buckets.end() || b->second.find(key) == b->second.end()) {
    return MakeStoreError(StoreError::NOT_FOUND, "MemoryGetObject",
                          FormatObject(bucket, key));
  }
  const vector<char> &data = b->second.find(key)->second;
  if (length == 0) {
    offset = 0;
    length = data.size();
  } else if (offset >= data.size()) {
    return MakeStoreError(StoreError::INVALID_ARGUMENT, "MemoryGetObject",
                          "Range out of object " + FormatObject(bucket, key));
  }

  uint64_t end = offset + length;
  if (end > data.size()) {
    end = data.size();
  }
  if (buffer != NULL) {
    buffer->assign(data.begin() + offset, data.begin() + end);
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::PutObject(const string &bucket,
                                         const string &key,
                                         const vector<char> &body) {
  CountRequest("PutObject");
  if (bucket.empty() || key.empty()) {
    return MakeStoreError(StoreError::PARAMETER_MISSING, "MemoryPutObject",
                          "Empty bucket or key");
  }
  lock_guard<mutex> lock(m_lock);
  m_buckets[bucket][key] = body;
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::InitiateMultipartUpload(const string &bucket,
                                                       const string &key,
                                                       string *uploadId) {
  CountRequest("InitiateMultipartUpload");
  if (bucket.empty() || key.empty()) {
    return MakeStoreError(StoreError::PARAMETER_MISSING,
                          "MemoryInitiateMultipartUpload",
                          "Empty bucket or key");
  }
  lock_guard<mutex> lock(m_lock);
  string id = "upload-" + to_string(m_nextUploadId++);
  Upload &upload = m_uploads[id];
  upload.bucket = bucket;
  upload.key = key;
  if (uploadId != NULL) {
    *uploadId = id;
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::UploadMultipart(const string &bucket,
                                               const string &key,
                                               const string &uploadId,
                                               int partNumber,
                                               const vector<char> &body,
                                               string *partTag) {
  CountRequest("UploadMultipart");
  lock_guard<mutex> lock(m_lock);
  map<string, Upload>::iterator it = m_uploads.find(uploadId);
  if (it == m_uploads.end() || it->second.bucket != bucket ||
      it->second.key != key) {
    return MakeStoreError(StoreError::NO_SUCH_UPLOAD, "MemoryUploadMultipart",
                          uploadId);
  }
  if (partNumber < 1) {
    return MakeStoreError(StoreError::INVALID_ARGUMENT,
                          "MemoryUploadMultipart",
                          "Invalid part number " + to_string(partNumber));
  }
  // a re-uploaded part replaces the old one along with its tag
  string tag = uploadId + "-" + to_string(partNumber) + "-" +
               to_string(body.size());
  it->second.parts[partNumber] = body;
  it->second.tags[partNumber] = tag;
  if (partTag != NULL) {
    *partTag = tag;
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::CompleteMultipartUpload(
    const string &bucket, const string &key, const string &uploadId,
    const vector<CompletedPart> &sortedParts) {
  CountRequest("CompleteMultipartUpload");
  lock_guard<mutex> lock(m_lock);
  map<string, Upload>::iterator it = m_uploads.find(uploadId);
  if (it == m_uploads.end() || it->second.bucket != bucket ||
      it->second.key != key) {
    return MakeStoreError(StoreError::NO_SUCH_UPLOAD,
                          "MemoryCompleteMultipartUpload", uploadId);
  }

  vector<char> object;
  int lastPart = 0;
  BOOST_FOREACH(const CompletedPart &part, sortedParts) {
    if (part.partNumber <= lastPart) {
      return MakeStoreError(StoreError::INVALID_ARGUMENT,
                            "MemoryCompleteMultipartUpload",
                            "Parts not in ascending order");
    }
    map<int, vector<char> >::const_iterator data =
        it->second.parts.find(part.partNumber);
    if (data == it->second.parts.end()) {
      return MakeStoreError(StoreError::INVALID_ARGUMENT,
                            "MemoryCompleteMultipartUpload",
                            "Missing part " + to_string(part.partNumber));
    }
    if (it->second.tags[part.partNumber] != part.partTag) {
      return MakeStoreError(StoreError::INVALID_ARGUMENT,
                            "MemoryCompleteMultipartUpload",
                            "Tag of part " + to_string(part.partNumber) +
                                " does not match");
    }
    object.insert(object.end(), data->second.begin(), data->second.end());
    lastPart = part.partNumber;
  }

  m_buckets[bucket][key].swap(object);
  m_uploads.erase(it);
  m_lastCompletedParts = sortedParts;
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::AbortMultipartUpload(const string &bucket,
                                                    const string &key,
                                                    const string &uploadId) {
  CountRequest("AbortMultipartUpload");
  lock_guard<mutex> lock(m_lock);
  map<string, Upload>::iterator it = m_uploads.find(uploadId);
  if (it == m_uploads.end() || it->second.bucket != bucket ||
      it->second.key != key) {
    return MakeStoreError(StoreError::NO_SUCH_UPLOAD,
                          "MemoryAbortMultipartUpload", uploadId);
  }
  m_uploads.erase(it);
  m_abortedUploads.push_back(uploadId);
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::HeadObject(const string &bucket,
                                          const string &key, uint64_t *size) {
  CountRequest("HeadObject");
  lock_guard<mutex> lock(m_lock);
  map<string, ObjectMap>::const_iterator b = m_buckets.find(bucket);
  if (b == m_buckets.end()) {
    return MakeStoreError(StoreError::NOT_FOUND, "MemoryHeadObject",
                          FormatObject(bucket, key));
  }
  ObjectMap::const_iterator obj = b->second.find(key);
  if (obj == b->second.end()) {
    return MakeStoreError(StoreError::NOT_FOUND, "MemoryHeadObject",
                          FormatObject(bucket, key));
  }
  if (size != NULL) {
    *size = obj->second.size();
  }
  return Good();
}

// --------------------------------------------------------------------------
StoreClientError MemoryClient::ListObjects(const string &bucket,
                                           const string &prefix,
                                           vector<ObjectSummary> *summaries) {
  CountRequest("ListObjects");
  lock_guard<mutex> lock(m_lock);
  if (summaries == NULL) {
    return Good();
  }
  summaries->clear();
  map<string, ObjectMap>::const_iterator b = m_buckets.find(bucket);
  if (b == m_buckets.end()) {
    return Good();
  }
  for (ObjectMap::const_iterator it = b->second.lower_bound(prefix);
       it != b->second.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    summaries->push_back(ObjectSummary(it->first, it->second.size()));
  }
  return Good();
}

// --------------------------------------------------------------------------
bool MemoryClient::HasObject(const string &bucket, const string &key) const {
  lock_guard<mutex> lock(m_lock);
  map<string, ObjectMap>::const_iterator b = m_buckets.find(bucket);
  return b != m_buckets.end() && b->second.find(key) != b->second.end();
}

// --------------------------------------------------------------------------
vector<char> MemoryClient::GetStoredObject(const string &bucket,
                                           const string &key) const {
  lock_guard<mutex> lock(m_lock);
  map<string, ObjectMap>::const_iterator b = m_buckets.find(bucket);
  if (b == m_buckets.end()) {
    return vector<char>();
  }
  ObjectMap::const_iterator obj = b->second.find(key);
  return obj == b->second.end() ? vector<char>() : obj->second;
}

// --------------------------------------------------------------------------
size_t MemoryClient::GetRequestCount(const string &operation) const {
  lock_guard<mutex> lock(m_lock);
  map<string, size_t>::const_iterator it = m_requestCounts.find(operation);
  return it == m_requestCounts.end() ? 0 : it->second;
}

// --------------------------------------------------------------------------
size_t MemoryClient::GetTotalRequestCount() const {
  lock_guard<mutex> lock(m_lock);
  size_t total = 0;
  for (map<string, size_t>::const_iterator it = m_requestCounts.begin();
       it != m_requestCounts.end(); ++it) {
    total += it->second;
  }
  return total;
}

// --------------------------------------------------------------------------
size_t MemoryClient::GetOpenUploadCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_uploads.size();
}

// --------------------------------------------------------------------------
const vector<string> MemoryClient::GetAbortedUploads() const {
  lock_guard<mutex> lock(m_lock);
  return m_abortedUploads;
}

// --------------------------------------------------------------------------
const vector<CompletedPart> MemoryClient::GetLastCompletedParts() const {
  lock_guard<mutex> lock(m_lock);
  return m_lastCompletedParts;
}

}  // namespace Client
}  // namespace QSX
