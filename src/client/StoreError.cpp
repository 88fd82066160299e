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

#include "client/StoreError.h"

#include <string>
#include <utility>

namespace QSX {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
string StoreErrorToString(StoreError::Value err) {
  pair<StoreError::Value, const char *> errToNames[] = {
      // keep in sorted order
      make_pair(StoreError::UNKNOWN, "Unknown"),
      make_pair(StoreError::GOOD, "Good"),
      make_pair(StoreError::REQUEST_SEND_ERROR, "RequestSendError"),
      make_pair(StoreError::REQUEST_TIMEOUT, "RequestTimeout"),
      make_pair(StoreError::THROTTLED, "Throttled"),
      make_pair(StoreError::SERVER_ERROR, "ServerError"),
      make_pair(StoreError::SHORT_READ, "ShortRead"),
      make_pair(StoreError::NOT_FOUND, "NotFound"),
      make_pair(StoreError::NO_SUCH_UPLOAD, "NoSuchUpload"),
      make_pair(StoreError::PARAMETER_MISSING, "ParameterMissing"),
      make_pair(StoreError::INVALID_ARGUMENT, "InvalidArgument"),
      make_pair(StoreError::ACCESS_DENIED, "AccessDenied"),
      make_pair(StoreError::UNEXPECTED_RESPONSE, "UnexpectedResponse"),
      make_pair(StoreError::LOCAL_IO_ERROR, "LocalIOError"),
  };

  int n = sizeof(errToNames) / sizeof(errToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
bool IsTransientStoreError(StoreError::Value err) {
  switch (err) {
    case StoreError::REQUEST_SEND_ERROR:
    case StoreError::REQUEST_TIMEOUT:
    case StoreError::THROTTLED:
    case StoreError::SERVER_ERROR:
    case StoreError::SHORT_READ:
      return true;
    default:
      return false;
  }
}

// --------------------------------------------------------------------------
StoreClientError MakeStoreError(StoreError::Value err,
                                const string &exceptionName,
                                const string &message) {
  return StoreClientError(err, exceptionName, message,
                          IsTransientStoreError(err));
}

// --------------------------------------------------------------------------
string GetMessageForStoreError(const StoreClientError &error) {
  return StoreErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodStoreError(const StoreClientError &error) {
  return error.GetError() == StoreError::GOOD;
}

}  // namespace Client
}  // namespace QSX
