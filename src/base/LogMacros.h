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

#ifndef QSXFER_BASE_LOGMACROS_H_
#define QSXFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/Logging.h"

#ifdef DISABLE_QSXFER_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)

#else  // !DISABLE_QSXFER_LOGGING

#define QSXFER_LOG_PREFIX(level) \
  QSX::Logging::GetLogLevelPrefix(QSX::Logging::LogLevel::level)

// The INFO stream is flushed after every non-fatal message, so a reader of
// the log files (the unit tests included) always sees complete records.
#define QSXFER_LOG_FLUSHED(severity, level, msg)             \
  {                                                          \
    LOG(severity) << QSXFER_LOG_PREFIX(level) << msg;        \
    google::FlushLogFiles(google::INFO);                     \
  }

#define QSXFER_LOG_IF_FLUSHED(severity, level, condition, msg)          \
  {                                                                     \
    LOG_IF(severity, (condition)) << QSXFER_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);                                \
  }

#define QSXFER_IS_DEBUG() QSX::Logging::Log::Instance().IsDebug()

#define Info(msg) QSXFER_LOG_FLUSHED(INFO, Info, msg)
#define Warning(msg) QSXFER_LOG_FLUSHED(WARNING, Warn, msg)
#define Error(msg) QSXFER_LOG_FLUSHED(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << QSXFER_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) QSXFER_LOG_IF_FLUSHED(INFO, Info, condition, msg)
#define WarningIf(condition, msg) \
  QSXFER_LOG_IF_FLUSHED(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) \
  QSXFER_LOG_IF_FLUSHED(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << QSXFER_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_FLUSHED(INFO, Info, msg) }
#define DebugWarning(msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_FLUSHED(WARNING, Warn, msg) }
#define DebugError(msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_FLUSHED(ERROR, Error, msg) }

#define DebugInfoIf(condition, msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_IF_FLUSHED(INFO, Info, condition, msg) }
#define DebugWarningIf(condition, msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_IF_FLUSHED(WARNING, Warn, condition, msg) }
#define DebugErrorIf(condition, msg) \
  { if (QSXFER_IS_DEBUG()) QSXFER_LOG_IF_FLUSHED(ERROR, Error, condition, msg) }

#endif  // DISABLE_QSXFER_LOGGING

#endif  // QSXFER_BASE_LOGMACROS_H_
