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

#include "client/TransferError.h"

#include <string>

namespace QSX {

namespace Client {

using std::string;

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  static const char *names[] = {
      // keep in enum order
      "Good",         "EmptyObject",       "TooManyChunks", "SessionError",
      "ChunkFailed",  "IntegrityMismatch", "StoreError",    "LocalIOError",
  };
  int n = sizeof(names) / sizeof(names[0]);
  int idx = static_cast<int>(err);
  return (idx >= 0 && idx < n) ? names[idx] : "Unknown";
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(const TransferClientError &error) {
  return TransferErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const TransferClientError &error) {
  return error.GetError() == TransferError::GOOD;
}

}  // namespace Client
}  // namespace QSX
