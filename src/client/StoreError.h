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

#ifndef QSXFER_CLIENT_STOREERROR_H_
#define QSXFER_CLIENT_STOREERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace QSX {

namespace Client {

// Errors of a single object store request, independent of the backend.
struct StoreError {
  enum Value {
    UNKNOWN,
    GOOD,

    // transient, the request may be repeated
    REQUEST_SEND_ERROR,  // request sent but no response
    REQUEST_TIMEOUT,
    THROTTLED,           // too many requests (429)
    SERVER_ERROR,        // 5xx
    SHORT_READ,          // fewer bytes than requested came back

    // permanent
    NOT_FOUND,           // no such key (404)
    NO_SUCH_UPLOAD,      // unknown or finished multipart session
    PARAMETER_MISSING,
    INVALID_ARGUMENT,
    ACCESS_DENIED,       // 401, 403 or a request signed with invalid key
    UNEXPECTED_RESPONSE,
    LOCAL_IO_ERROR       // reading the local source failed
  };
};

typedef ClientError<StoreError::Value> StoreClientError;

std::string StoreErrorToString(StoreError::Value err);

// Whether an error of this kind is worth another attempt
bool IsTransientStoreError(StoreError::Value err);

// Build an error, the retryable flag follows IsTransientStoreError
StoreClientError MakeStoreError(StoreError::Value err,
                                const std::string &exceptionName,
                                const std::string &message);

std::string GetMessageForStoreError(const StoreClientError &error);
bool IsGoodStoreError(const StoreClientError &error);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_STOREERROR_H_
