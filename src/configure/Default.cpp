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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"
#include "base/StringUtils.h"

namespace QSX {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "qsxfer";
static const char* const PROGRAM_VERSION = "1.0.0";
static const char* const QSXFER_DEFAULT_LOG_DIR = "/tmp/qsxfer_log/";
static const char* const QSXFER_DEFAULT_LOGLEVEL_NAME = "WARN";
static const char* const QSXFER_DEFAULT_HOST = "qingstor.com";
static const char* const QSXFER_DEFAULT_PROTOCOL = "https";
static const char* const QSXFER_DEFAULT_ZONE = "pek3a";
static uint16_t const QSXFER_DEFAULT_TRANSACTION_RETRIES = 10;
static uint16_t const QSXFER_DEFAULT_CHUNK_MAX_RETRIES = 5;

const char* GetProgramName() { return PROGRAM_NAME; }
const char* GetProgramVersion() { return PROGRAM_VERSION; }

string GetDefaultLogDirectory() { return QSXFER_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return QSXFER_DEFAULT_LOGLEVEL_NAME; }
uint32_t GetMaxLogSizeMB() { return 100; }
string GetDefaultHostName() { return QSXFER_DEFAULT_HOST; }

uint16_t GetDefaultPort(const string& protocolName) {
  static const uint16_t HTTP_DEFAULT_PORT = 80;
  static const uint16_t HTTPS_DEFAULT_PORT = 443;
  return QSX::StringUtils::ToLower(protocolName) == "http" ? HTTP_DEFAULT_PORT
                                                           : HTTPS_DEFAULT_PORT;
}

string GetDefaultProtocolName() { return QSXFER_DEFAULT_PROTOCOL; }
string GetDefaultZone() { return QSXFER_DEFAULT_ZONE; }

mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint16_t GetDefaultTransactionRetries() {
  return QSXFER_DEFAULT_TRANSACTION_RETRIES;
}

uint32_t GetDefaultTransactionTimeDuration() { return 30; }

uint64_t GetDefaultChunkSize() {
  // Decimal megabytes, so a 25 MB object splits into 10 + 10 + 5.
  return QSX::Size::M10;
}

uint32_t GetDefaultMaxChunks() { return 10000; }

size_t GetDefaultWorkerBudget() { return 10; }

uint16_t GetDefaultChunkMaxRetries() { return QSXFER_DEFAULT_CHUNK_MAX_RETRIES; }

uint16_t GetDefaultRetryScaleFactor() { return 25; }

uint16_t GetMaxListObjectsCount() { return 1000; }

}  // namespace Default
}  // namespace Configure
}  // namespace QSX
