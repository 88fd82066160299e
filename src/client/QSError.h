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

#ifndef QSXFER_CLIENT_QSERROR_H_
#define QSXFER_CLIENT_QSERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

#include "client/StoreError.h"

namespace QSX {

namespace Client {

//
// Mapping of QingStor SDK results onto StoreError.
//
// The sdk returns NO_ERROR if the response is the one expected by the api
// definition and UNEXPECTED_RESPONSE otherwise. Those definitions are not
// complete (many requests only expect 200), so the http code decides in the
// latter case.
//

bool SDKResponseSuccess(QsError sdkErr, QingStor::Http::HttpResponseCode code);

StoreError::Value SDKResponseToStoreError(
    QsError sdkErr, QingStor::Http::HttpResponseCode code);

std::string SDKResponseCodeToName(QingStor::Http::HttpResponseCode code);
int SDKResponseCodeToInt(QingStor::Http::HttpResponseCode code);

// Return "<code> <name>", such as "404 NotFound"
std::string SDKResponseCodeToString(QingStor::Http::HttpResponseCode code);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_QSERROR_H_
