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

#ifndef QSXFER_CLIENT_TRANSFERERROR_H_
#define QSXFER_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace QSX {

namespace Client {

// Errors of a whole chunked transfer.
struct TransferError {
  enum Value {
    GOOD,

    // planning
    EMPTY_OBJECT,     // nothing to transfer
    TOO_MANY_CHUNKS,  // chunk count would exceed the configured maximum

    // execution
    SESSION_ERROR,       // open or commit of a multipart session failed
    CHUNK_FAILED,        // a chunk failed permanently or ran out of retries
    INTEGRITY_MISMATCH,  // final size differs from the source size
    STORE_ERROR,         // a single-shot request or size query failed
    LOCAL_IO_ERROR       // local file could not be read or written
  };
};

typedef ClientError<TransferError::Value> TransferClientError;

std::string TransferErrorToString(TransferError::Value err);

std::string GetMessageForTransferError(const TransferClientError &error);
bool IsGoodTransferError(const TransferClientError &error);

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_TRANSFERERROR_H_
