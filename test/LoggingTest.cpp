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

#include <stdio.h>     // for fopen
#include <sys/stat.h>  // for stat

#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"

namespace QSX {

namespace Logging {

// glog keeps qsxfer.INFO and qsxfer.FATAL linked to the latest log files,
// the checks below read those links.

using std::ifstream;
using std::string;
using std::vector;
using ::testing::TestWithParam;
using ::testing::Values;

static const char *logDir = "/tmp/qsxfer.test.logs/";
static const char *infoLogFile = "/tmp/qsxfer.test.logs/qsxfer.INFO";
static const char *fatalLogFile = "/tmp/qsxfer.test.logs/qsxfer.FATAL";

// One record written by LogEveryMacro
struct Record {
  LogLevel::Value level;
  bool debugOnly;
  const char *text;
};

static const Record records[] = {
    {LogLevel::Error, false, "chunk 3 failed"},
    {LogLevel::Error, false, "session not committed"},
    {LogLevel::Error, true, "abort rejected"},
    {LogLevel::Error, true, "short read"},
    {LogLevel::Warn, false, "retry part 2"},
    {LogLevel::Warn, false, "retry part 5"},
    {LogLevel::Warn, true, "throttled"},
    {LogLevel::Warn, true, "slow store"},
    {LogLevel::Info, false, "planned 3 chunks"},
    {LogLevel::Info, false, "opened session"},
    {LogLevel::Info, true, "dispatched chunk 0"},
    {LogLevel::Info, true, "drained"},
};

void LogEveryMacro() {
  Error("chunk 3 failed");
  ErrorIf(true, "session not committed");
  ErrorIf(false, "never written");
  DebugError("abort rejected");
  DebugErrorIf(true, "short read");
  Warning("retry part 2");
  WarningIf(true, "retry part 5");
  DebugWarning("throttled");
  DebugWarningIf(true, "slow store");
  DebugWarningIf(false, "never written");
  Info("planned 3 chunks");
  InfoIf(true, "opened session");
  DebugInfo("dispatched chunk 0");
  DebugInfoIf(true, "drained");
}

void TruncateFile(const string &path) {
  FILE *pf = fopen(path.c_str(), "w");
  if (pf != NULL) {
    fclose(pf);
  }
}

// Lines of the file from the first level tag on, such as "[WARN] throttled"
vector<string> ReadTaggedLines(const string &path, const char *const *tags,
                               size_t tagCount) {
  vector<string> lines;
  ifstream file(path.c_str());
  for (string line; std::getline(file, line);) {
    for (size_t i = 0; i < tagCount; ++i) {
      string::size_type pos = line.find(tags[i]);
      if (pos != string::npos) {
        lines.push_back(line.substr(pos));
        break;
      }
    }
  }
  return lines;
}

vector<string> ExpectedLines(LogLevel::Value minLevel, bool debug) {
  vector<string> lines;
  for (size_t i = 0; i < sizeof(records) / sizeof(records[0]); ++i) {
    if (records[i].level < minLevel || (records[i].debugOnly && !debug)) {
      continue;
    }
    lines.push_back(GetLogLevelPrefix(records[i].level) + records[i].text);
  }
  return lines;
}

struct LoggingCase {
  LogLevel::Value level;
  bool debug;
};

class LoggingTest : public TestWithParam<LoggingCase> {
 public:
  static void SetUpTestCase() {
    ASSERT_TRUE(QSX::Utils::CreateDirectoryIfNotExists(logDir));
    Log::Instance().Initialize(logDir);
  }

 protected:
  void LogAndVerify() {
    Log::Instance().SetDebug(GetParam().debug);
    Log::Instance().SetLogLevel(GetParam().level);
    EXPECT_EQ(Log::Instance().GetLogLevel(), GetParam().level);

    // only the records of this case
    TruncateFile(infoLogFile);
    LogEveryMacro();

    struct stat info;
    ASSERT_EQ(stat(infoLogFile, &info), 0) << infoLogFile << " is missing";
    static const char *const tags[] = {"[INFO] ", "[WARN] ", "[ERROR] "};
    EXPECT_EQ(ReadTaggedLines(infoLogFile, tags, 3),
              ExpectedLines(GetParam().level, GetParam().debug));
  }
};

TEST_P(LoggingTest, LevelAndDebug) { LogAndVerify(); }

LoggingCase MakeCase(LogLevel::Value level, bool debug) {
  LoggingCase c = {level, debug};
  return c;
}

INSTANTIATE_TEST_CASE_P(NonFatal, LoggingTest,
                        Values(MakeCase(LogLevel::Info, true),
                               MakeCase(LogLevel::Warn, true),
                               MakeCase(LogLevel::Error, true),
                               MakeCase(LogLevel::Info, false),
                               MakeCase(LogLevel::Warn, false)));

// Logging a FATAL message terminates the program
class FatalLoggingDeathTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    ASSERT_TRUE(QSX::Utils::CreateDirectoryIfNotExists(logDir));
    Log::Instance().Initialize(logDir);
  }

  string ReadFatalLine() {
    static const char *const tags[] = {"[FATAL] "};
    vector<string> lines = ReadTaggedLines(fatalLogFile, tags, 1);
    return lines.empty() ? string() : lines.front();
  }
};

TEST_F(FatalLoggingDeathTest, Fatal) {
  ASSERT_DEATH({ Fatal("worker pool lost"); }, "");
  EXPECT_EQ(ReadFatalLine(), "[FATAL] worker pool lost");
}

TEST_F(FatalLoggingDeathTest, FatalIf) {
  FatalIf(false, "never written");
  ASSERT_DEATH({ FatalIf(true, "gate over budget"); }, "");
  EXPECT_EQ(ReadFatalLine(), "[FATAL] gate over budget");
}

}  // namespace Logging
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
