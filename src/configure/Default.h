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

#ifndef QSXFER_CONFIGURE_DEFAULT_H_
#define QSXFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace QSX {

namespace Configure {

namespace Default {

const char* GetProgramName();
const char* GetProgramVersion();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
uint32_t GetMaxLogSizeMB();
std::string GetDefaultHostName();
uint16_t GetDefaultPort(const std::string& protocolName);
std::string GetDefaultProtocolName();
std::string GetDefaultZone();

mode_t GetDefineDirMode();

uint16_t GetDefaultTransactionRetries();        // sdk connection retries
uint32_t GetDefaultTransactionTimeDuration();   // in seconds

uint64_t GetDefaultChunkSize();      // bytes per chunk
uint32_t GetDefaultMaxChunks();      // upper bound of chunks per object
size_t GetDefaultWorkerBudget();     // in-flight chunk transfers
uint16_t GetDefaultChunkMaxRetries();  // attempts per chunk, first included
uint16_t GetDefaultRetryScaleFactor();  // backoff unit in milliseconds

uint16_t GetMaxListObjectsCount();  // page size of a list request

}  // namespace Default
}  // namespace Configure
}  // namespace QSX

#endif  // QSXFER_CONFIGURE_DEFAULT_H_
