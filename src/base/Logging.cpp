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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <string>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace QSX {

namespace Logging {

using QSX::Exception::QSXException;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  string name;
  switch (logLevel) {
    case LogLevel::Info:
      name = "INFO";
      break;
    case LogLevel::Warn:
      name = "WARN";
      break;
    case LogLevel::Error:
      name = "ERROR";
      break;
    case LogLevel::Fatal:
      name = "FATAL";
      break;
    default:
      break;
  }
  return name;
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  string lower = QSX::StringUtils::ToLower(QSX::StringUtils::Trim(name, ' '));
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  } else if (lower == "error") {
    return LogLevel::Error;
  } else if (lower == "fatal") {
    return LogLevel::Fatal;
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    if (!QSX::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw QSXException("Unable to create log directory " + logdir + " : " +
                         strerror(errno));
    }
    if (!QSX::Utils::IsWritableDirectory(logdir)) {
      throw QSXException("Could not create logging file at " + logdir +
                         ": Permission denied");
    }

    // glog reads FLAGS_log_dir only when the log files are opened, so it
    // must be set before InitGoogleLogging.
    m_logDirectory = logdir;
    FLAGS_log_dir = logdir.c_str();
    FLAGS_max_log_size = QSX::Configure::Default::GetMaxLogSizeMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  google::InitGoogleLogging(QSX::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

}  // namespace Logging
}  // namespace QSX
