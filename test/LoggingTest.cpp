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
// +-------------------------------------------------------------------------

#include <stdio.h>     // for fopen

#include <fstream>
#include <ostream>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "gtest/gtest.h"

#include "base/LogLevel.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "configure/Options.h"

namespace QSXfer {

namespace Logging {

// glog keeps qsxfer.INFO and qsxfer.FATAL linked to the newest log file of
// that severity. Fixtures live in the namespace of Log to be its friend.

using std::ifstream;
using std::ostream;
using std::string;
using std::vector;
using ::testing::Values;

static const char *logDir = "/tmp/qsxfer.test.logs/";
static const char *infoLog = "/tmp/qsxfer.test.logs/qsxfer.INFO";
static const char *fatalLog = "/tmp/qsxfer.test.logs/qsxfer.FATAL";

void Truncate(const char *path) {
  FILE *pf = fopen(path, "w");
  if (pf != NULL) {
    fclose(pf);
  }
}

// Collect every line tagged with one of the given level prefixes, starting
// at the tag.
vector<string> ReadTaggedLines(const char *path,
                               const vector<string> &tags) {
  vector<string> lines;
  ifstream in(path);
  for (string line; std::getline(in, line);) {
    for (vector<string>::const_iterator tag = tags.begin(); tag != tags.end();
         ++tag) {
      string::size_type pos = line.find(*tag);
      if (pos != string::npos) {
        lines.push_back(line.substr(pos));
        break;
      }
    }
  }
  return lines;
}

vector<string> NonFatalTags() {
  vector<string> tags;
  tags.push_back("[INFO]");
  tags.push_back("[WARN]");
  tags.push_back("[ERROR]");
  return tags;
}

// One line per macro, from the most to the least severe
void LogTransferEvents() {
  Error("chunk 3 failed");
  ErrorIf(true, "item 2 failed");
  ErrorIf(false, "never logged");
  DebugError("chunk 3 detail");
  Warning("callback slow");
  WarningIf(true, "metadata missing");
  DebugWarning("retry skipped");
  Info("upload started");
  InfoIf(true, "download started");
  DebugInfo("item 0 done");
  DebugInfoIf(true, "item 1 done");
  DebugInfoIf(false, "never logged");
}

vector<string> ExpectedTransferEvents(LogLevel::Value level, bool debug) {
  vector<string> lines;
  lines.push_back("[ERROR] chunk 3 failed");
  lines.push_back("[ERROR] item 2 failed");
  if (debug) {
    lines.push_back("[ERROR] chunk 3 detail");
  }
  if (level == LogLevel::Error) {
    return lines;
  }
  lines.push_back("[WARN] callback slow");
  lines.push_back("[WARN] metadata missing");
  if (debug) {
    lines.push_back("[WARN] retry skipped");
  }
  if (level == LogLevel::Warn) {
    return lines;
  }
  lines.push_back("[INFO] upload started");
  lines.push_back("[INFO] download started");
  if (debug) {
    lines.push_back("[INFO] item 0 done");
    lines.push_back("[INFO] item 1 done");
  }
  return lines;
}

struct LevelCase {
  LevelCase(LogLevel::Value lv, bool dbg) : level(lv), debug(dbg) {}

  friend ostream &operator<<(ostream &os, const LevelCase &c) {
    return os << "[level: " << GetLogLevelName(c.level)
              << ", debug: " << std::boolalpha << c.debug << "]";
  }

  LogLevel::Value level;
  bool debug;
};

class LoggingTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    ASSERT_TRUE(QSXfer::Utils::CreateDirectoryIfNotExists(logDir));
    Log::Instance().Initialize(logDir);
  }

 protected:
  void Apply(LogLevel::Value level, bool debug) {
    Log::Instance().SetLogLevel(level);
    Log::Instance().SetDebug(debug);
  }
};

class LogLevelFilterTest : public LoggingTest,
                           public ::testing::WithParamInterface<LevelCase> {};

TEST_P(LogLevelFilterTest, OnlyLevelsAtOrAboveAreWritten) {
  Apply(GetParam().level, GetParam().debug);
  Truncate(infoLog);
  LogTransferEvents();
  google::FlushLogFiles(google::GLOG_INFO);
  EXPECT_EQ(ExpectedTransferEvents(GetParam().level, GetParam().debug),
            ReadTaggedLines(infoLog, NonFatalTags()));
}

INSTANTIATE_TEST_CASE_P(Levels, LogLevelFilterTest,
                        Values(LevelCase(LogLevel::Info, true),
                               LevelCase(LogLevel::Info, false),
                               LevelCase(LogLevel::Warn, true),
                               LevelCase(LogLevel::Warn, false),
                               LevelCase(LogLevel::Error, true),
                               LevelCase(LogLevel::Error, false)));

TEST_F(LoggingTest, InitializeTwiceKeepsFirstDirectory) {
  Log::Instance().Initialize("/tmp/qsxfer.test.other.logs/");
  EXPECT_EQ(string(logDir), Log::Instance().GetLogDirectory());
}

TEST_F(LoggingTest, InitializerAppliesOptions) {
  QSXfer::Configure::Options &options =
      QSXfer::Configure::Options::Instance();
  options.SetLogDirectory(logDir);
  options.SetForeground(false);
  options.SetClearLogDir(false);
  options.SetDebug(false);
  options.SetLogLevel(LogLevel::Warn);

  LoggingInitializer();
  EXPECT_EQ(LogLevel::Warn, Log::Instance().GetLogLevel());
  EXPECT_FALSE(Log::Instance().IsDebug());
  EXPECT_EQ(string(logDir), Log::Instance().GetLogDirectory());

  Truncate(infoLog);
  LogTransferEvents();
  google::FlushLogFiles(google::GLOG_INFO);
  EXPECT_EQ(ExpectedTransferEvents(LogLevel::Warn, false),
            ReadTaggedLines(infoLog, NonFatalTags()));
}

// A FATAL message terminates the process, so it is checked in death tests.
typedef boost::function<void(bool)> FatalLogger;

void LogFatal(bool /*condition*/) { Fatal("transfer aborted"); }
void LogFatalIf(bool condition) { FatalIf(condition, "transfer aborted"); }
void LogDebugFatal(bool /*condition*/) { DebugFatal("transfer aborted"); }
void LogDebugFatalIf(bool condition) {
  DebugFatalIf(condition, "transfer aborted");
}

struct FatalCase {
  FatalCase(FatalLogger func, bool cond, bool dbg, bool die)
      : logger(func), condition(cond), debug(dbg), dies(die) {}

  friend ostream &operator<<(ostream &os, const FatalCase &c) {
    return os << "[condition: " << std::boolalpha << c.condition
              << ", debug: " << c.debug << ", dies: " << c.dies << "]";
  }

  FatalLogger logger;
  bool condition;  // *If macros only
  bool debug;      // Debug* macros only
  bool dies;
};

class FatalLoggingDeathTest : public LoggingTest,
                              public ::testing::WithParamInterface<FatalCase> {
};

TEST_P(FatalLoggingDeathTest, DiesOnlyWhenEnabled) {
  const FatalCase &param = GetParam();
  Apply(LogLevel::Info, param.debug);
  if (param.dies) {
    Truncate(fatalLog);
    ASSERT_DEATH({ param.logger(param.condition); }, "");
    vector<string> tags(1, "[FATAL]");
    vector<string> lines = ReadTaggedLines(fatalLog, tags);
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ("[FATAL] transfer aborted", lines.front());
  } else {
    param.logger(param.condition);
    SUCCEED();
  }
}

INSTANTIATE_TEST_CASE_P(
    Fatal, FatalLoggingDeathTest,
    // logger, condition, debug, dies
    Values(FatalCase(LogFatal, true, false, true),
           FatalCase(LogFatalIf, true, false, true),
           FatalCase(LogFatalIf, false, false, false),
           FatalCase(LogDebugFatal, true, true, true),
           FatalCase(LogDebugFatal, true, false, false),
           FatalCase(LogDebugFatalIf, true, true, true),
           FatalCase(LogDebugFatalIf, false, true, false),
           FatalCase(LogDebugFatalIf, true, false, false)));

}  // namespace Logging
}  // namespace QSXfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
