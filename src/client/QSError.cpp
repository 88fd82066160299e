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

#include "client/QSError.h"

#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

namespace QSX {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::make_pair;
using std::pair;
using std::string;

namespace {

bool IsSuccessCode(HttpResponseCode code) {
  int value = static_cast<int>(code);
  return value >= 100 && value < 400;
}

}  // namespace

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  return sdkErr == QS_ERR_NO_ERROR ||
         (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && IsSuccessCode(code));
}

// --------------------------------------------------------------------------
StoreError::Value SDKResponseToStoreError(QsError sdkErr,
                                          HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  switch (sdkErr) {
    case QS_ERR_NO_ERROR:
      return StoreError::GOOD;
    case QS_ERR_SEND_REQUEST_ERROR:
      return StoreError::REQUEST_SEND_ERROR;
    case QS_ERR_NO_REQUIRED_PARAMETER:
      return StoreError::PARAMETER_MISSING;
    case QS_ERR_SIGN_WITH_INVAILD_KEY:
      return StoreError::ACCESS_DENIED;
    case QS_ERR_INVAILD_CONFIG_FILE:
      return StoreError::INVALID_ARGUMENT;
    case QS_ERR_UNEXCEPTED_RESPONSE:
      break;
    default:
      return StoreError::UNKNOWN;
  }

  if (IsSuccessCode(code)) {
    return StoreError::GOOD;
  }
  if (code == NETWORK_READ_TIMEOUT || code == NETWORK_CONNECT_TIMEOUT ||
      code == GATEWAY_TIMEOUT) {
    return StoreError::REQUEST_TIMEOUT;
  }
  if (code == TOO_MANY_REQUESTS) {
    return StoreError::THROTTLED;
  }
  if (code == NOT_FOUND) {
    return StoreError::NOT_FOUND;
  }
  if (code == UNAUTHORIZED_OR_EXPIRED || code == FORBIDDEN) {
    return StoreError::ACCESS_DENIED;
  }
  if (code == BAD_REQUEST || code == INVALID_RANGE) {
    return StoreError::INVALID_ARGUMENT;
  }
  if (code == REQUEST_NOT_MADE) {
    return StoreError::REQUEST_SEND_ERROR;
  }
  int value = static_cast<int>(code);
  if (value >= 500 && value < 600) {
    return StoreError::SERVER_ERROR;
  }
  return StoreError::UNEXPECTED_RESPONSE;
}

// --------------------------------------------------------------------------
string SDKResponseCodeToName(HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  pair<HttpResponseCode, const char *> codeToNames[] = {
      // keep in sorted order
      make_pair(REQUEST_NOT_MADE, "RequestNotMade"),
      make_pair(OK, "Ok"),
      make_pair(CREATED, "Created"),
      make_pair(NO_CONTENT, "NoContent"),
      make_pair(PARTIAL_CONTENT, "PartialContent"),
      make_pair(NOT_MODIFIED, "NotModified"),
      make_pair(BAD_REQUEST, "BadRequest"),
      make_pair(UNAUTHORIZED_OR_EXPIRED, "UnauthorizedOrExpired"),
      make_pair(FORBIDDEN, "Forbidden"),
      make_pair(NOT_FOUND, "NotFound"),
      make_pair(CONFLICT, "Conflict"),
      make_pair(PRECONDITION_FAILED, "PreconditionFailed"),
      make_pair(INVALID_RANGE, "InvalidRange"),
      make_pair(TOO_MANY_REQUESTS, "TooManyRequests"),
      make_pair(INTERNAL_SERVER_ERROR, "InternalServerError"),
      make_pair(SERVICE_UNAVAILABLE, "ServiceUnavailable"),
      make_pair(GATEWAY_TIMEOUT, "GatewayTimeout"),
      make_pair(NETWORK_READ_TIMEOUT, "NetworkReadTimeout"),
      make_pair(NETWORK_CONNECT_TIMEOUT, "NetworkConnectTimeout"),
  };

  int n = sizeof(codeToNames) / sizeof(codeToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (code == codeToNames[mid].first) {
      return codeToNames[mid].second;
    }
    if (static_cast<int>(code) < static_cast<int>(codeToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
int SDKResponseCodeToInt(HttpResponseCode code) {
  return static_cast<int>(code);
}

// --------------------------------------------------------------------------
string SDKResponseCodeToString(HttpResponseCode code) {
  return to_string(SDKResponseCodeToInt(code)) + " " +
         SDKResponseCodeToName(code);
}

}  // namespace Client
}  // namespace QSX
