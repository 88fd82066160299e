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

#ifndef QSXFER_CLIENT_OPERATIONS_H_
#define QSXFER_CLIENT_OPERATIONS_H_

#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "client/Outcome.hpp"
#include "client/StoreError.h"

namespace QSX {

namespace Client {

class Client;

// Single request operations. Each request is retried with the retry
// strategy of the client.
namespace Operations {

typedef Outcome<std::vector<std::string>, StoreClientError> ListKeysOutcome;
typedef Outcome<std::map<std::string, uint64_t>, StoreClientError>
    ListKeysToMapOutcome;

// Upload a whole file in one put request
//
// @param  : client, bucket, local file path, object key
// @return : StoreClientError, LOCAL_IO_ERROR if the file cannot be read
StoreClientError UploadFile(Client &client, const std::string &bucket,
                            const std::string &filePath,
                            const std::string &objKey);

// Download a whole object in one get request and write it to a file
//
// @param  : client, bucket, object key, local file path
// @return : StoreClientError, LOCAL_IO_ERROR if the file cannot be written
StoreClientError DownloadFile(Client &client, const std::string &bucket,
                              const std::string &objKey,
                              const std::string &filePath);

// Read a whole object into memory
//
// @param  : client, bucket, object key, buffer (output)
// @return : StoreClientError
StoreClientError ReadObject(Client &client, const std::string &bucket,
                            const std::string &objKey,
                            std::vector<char> *buffer);

// Read a whole object into memory, if it exists
//
// @param  : client, bucket, object key, buffer (output), found (output)
// @return : StoreClientError
//
// A missing object is not an error, found is set to false instead.
StoreClientError TryGetObject(Client &client, const std::string &bucket,
                              const std::string &objKey,
                              std::vector<char> *buffer, bool *found);

// List keys under prefix, directory markers (keys ending with '/') excluded
//
// @param  : client, bucket, prefix
// @return : keys in listing order
ListKeysOutcome ListKeys(Client &client, const std::string &bucket,
                         const std::string &prefix);

// List keys under prefix with their sizes, directory markers excluded
//
// @param  : client, bucket, prefix
// @return : key to size map
ListKeysToMapOutcome ListKeysToMap(Client &client, const std::string &bucket,
                                   const std::string &prefix);

}  // namespace Operations
}  // namespace Client
}  // namespace QSX

#endif  // QSXFER_CLIENT_OPERATIONS_H_
