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

#ifndef QSXFER_BASE_LOGGING_H_
#define QSXFER_BASE_LOGGING_H_

#include <string>

#include "base/Singleton.hpp"

namespace QSX {

namespace Logging {

struct LogLevel {
  enum Value { Info = 0, Warn = 1, Error = 2, Fatal = 3 };
};

// Get log level name
//
// @param  : log level enumeration
// @return : log level name, such as "WARN"
std::string GetLogLevelName(LogLevel::Value logLevel);

// Get log level
//
// @param  : log level name (case insensitive)
// @return : log level enumeration
//
// Return Info if name not belongs to {INFO, WARN, WARNING, ERROR, FATAL}
LogLevel::Value GetLogLevelByName(const std::string &name);

// Get log level prefix, such as "[INFO] "
std::string GetLogLevelPrefix(LogLevel::Value logLevel);

//
// Log
//
// Glog wrapper. Initialize must be called to get log ready, and it's a
// one-time initialization. Specify a directory to log message to files under
// it, or log message to console with an empty directory.
//
class Log : public Singleton<Log> {
 public:
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  bool IsDebug() const { return m_isDebug; }

  // Initialize
  //
  // @param  : log dir, log to console if empty
  // @return : none
  //
  // Throw QSXException if log dir cannot be created or is not writable.
  void Initialize(const std::string &logdir = std::string());

  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }

 private:
  void DoInitialize(const std::string &logdir);

  Log()
      : m_logLevel(LogLevel::Info),
        m_logDirectory(std::string()),
        m_isDebug(false) {}

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // log to console if it's empty
  bool m_isDebug;

  friend class Singleton<Log>;
};

}  // namespace Logging
}  // namespace QSX

#endif  // QSXFER_BASE_LOGGING_H_
