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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Logging.h"
#include "configure/Default.h"

namespace QSX {

namespace Configure {

using boost::to_string;
using QSX::Configure::Default::GetDefaultChunkSize;
using QSX::Configure::Default::GetDefaultChunkMaxRetries;
using QSX::Configure::Default::GetDefaultHostName;
using QSX::Configure::Default::GetDefaultLogDirectory;
using QSX::Configure::Default::GetDefaultLogLevelName;
using QSX::Configure::Default::GetDefaultMaxChunks;
using QSX::Configure::Default::GetDefaultPort;
using QSX::Configure::Default::GetDefaultProtocolName;
using QSX::Configure::Default::GetDefaultTransactionRetries;
using QSX::Configure::Default::GetDefaultTransactionTimeDuration;
using QSX::Configure::Default::GetDefaultWorkerBudget;
using QSX::Configure::Default::GetDefaultZone;
using QSX::Logging::GetLogLevelByName;
using QSX::Logging::GetLogLevelName;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
Options::Options()
    : m_command(),
      m_arguments(),
      m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_accessKeyId(),
      m_secretKey(),
      m_additionalAgent(),
      m_retries(GetDefaultTransactionRetries()),
      m_requestTimeOut(GetDefaultTransactionTimeDuration()),
      m_chunkSize(GetDefaultChunkSize()),
      m_maxChunks(GetDefaultMaxChunks()),
      m_workerBudget(GetDefaultWorkerBudget()),
      m_chunkMaxRetries(GetDefaultChunkMaxRetries()),
      m_fileSize(0),
      m_logDirectory(GetDefaultLogDirectory()),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_listWithSize(false),
      m_debug(false),
      m_showHelp(false),
      m_showVersion(false) {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  string args;
  for (size_t i = 0; i < opts.m_arguments.size(); ++i) {
    if (i != 0) {
      args.append(" ");
    }
    args.append(opts.m_arguments[i]);
  }

  // Secret key is never printed.
  return os << "[command: " << opts.m_command << "] "
            << "[args: " << args << "] "
            << "[zone: " << opts.m_zone << "] "
            << "[host: " << opts.m_host << "] "
            << "[protocol: " << opts.m_protocol << "] "
            << "[port: " << to_string(opts.m_port) << "] "
            << "[access key id: " << opts.m_accessKeyId << "] "
            << "[additional agent: " << opts.m_additionalAgent << "] "
            << "[retries: " << to_string(opts.m_retries) << "] "
            << "[req timeout(s): " << to_string(opts.m_requestTimeOut) << "] "
            << "[chunk size: " << to_string(opts.m_chunkSize) << "] "
            << "[max chunks: " << to_string(opts.m_maxChunks) << "] "
            << "[workers: " << to_string(opts.m_workerBudget) << "] "
            << "[chunk retries: " << to_string(opts.m_chunkMaxRetries) << "] "
            << "[file size: " << to_string(opts.m_fileSize) << "] "
            << "[log directory: " << opts.m_logDirectory << "] "
            << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
            << std::boolalpha << "[list with size: " << opts.m_listWithSize
            << "] "
            << "[debug: " << opts.m_debug << "] "
            << "[show help: " << opts.m_showHelp << "] "
            << "[show version: " << opts.m_showVersion << "]"
            << std::noboolalpha;
}

}  // namespace Configure
}  // namespace QSX
