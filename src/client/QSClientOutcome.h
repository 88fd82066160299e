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

#ifndef QSXFER_CLIENT_QSCLIENTOUTCOME_H_
#define QSXFER_CLIENT_QSCLIENTOUTCOME_H_

#include <vector>

#include "qingstor/Bucket.h"

#include "client/Outcome.hpp"
#include "client/StoreError.h"

namespace QSX {

namespace Client {

typedef Outcome<std::vector<QingStor::ListObjectsOutput>, StoreClientError>
    ListObjectsOutcome;
typedef Outcome<QingStor::GetObjectOutput, StoreClientError> GetObjectOutcome;
typedef Outcome<QingStor::HeadObjectOutput, StoreClientError>
    HeadObjectOutcome;
typedef Outcome<QingStor::PutObjectOutput, StoreClientError> PutObjectOutcome;
typedef Outcome<QingStor::InitiateMultipartUploadOutput, StoreClientError>
    InitiateMultipartUploadOutcome;
typedef Outcome<QingStor::UploadMultipartOutput, StoreClientError>
    UploadMultipartOutcome;
typedef Outcome<QingStor::CompleteMultipartUploadOutput, StoreClientError>
    CompleteMultipartUploadOutcome;
typedef Outcome<QingStor::AbortMultipartUploadOutput, StoreClientError>
    AbortMultipartUploadOutcome;

}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_QSCLIENTOUTCOME_H_
