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

#include <stdio.h>
#include <sys/stat.h>

#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/LogMacros.h"
#include "base/Logging.h"

namespace KW {

namespace Logging {

// glog links kwclient.INFO in the log dir to the latest info file, which
// also receives warnings and errors.

using std::string;
using std::vector;

static const char *logDir = "/tmp/kwclient.logging.test";
static const char *infoLogFile = "/tmp/kwclient.logging.test/kwclient.INFO";

void ClearFileContent(const char *path) {
  FILE *pf = fopen(path, "w");
  if (pf != NULL) {
    fclose(pf);
  }
}

// Logged lines starting from their level prefix
vector<string> ReadLoggedLines() {
  vector<string> lines;
  std::ifstream in(infoLogFile);
  EXPECT_TRUE(in.is_open()) << "Fail to open " << infoLogFile;
  for (string line; std::getline(in, line);) {
    string::size_type pos = line.find("] [");
    if (pos != string::npos) {
      lines.push_back(line.substr(pos + 2));
    }
  }
  return lines;
}

class LoggingTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { Log::Instance().Initialize(logDir); }

  void SetUp() {
    Log::Instance().SetDebug(false);
    Log::Instance().SetLogLevel(LogLevel::Info);
    ClearFileContent(infoLogFile);
  }

  void TearDown() {
    Log::Instance().SetDebug(false);
    Log::Instance().SetLogLevel(LogLevel::Info);
  }

  void ExpectDefaults() {
    Log fresh;
    EXPECT_EQ(LogLevel::Info, fresh.GetLogLevel());
    EXPECT_FALSE(fresh.IsDebug());
    EXPECT_TRUE(fresh.LogsToConsole());
  }
};

TEST_F(LoggingTest, Defaults) { ExpectDefaults(); }

TEST_F(LoggingTest, InitializeOnlyOnce) {
  struct stat st;
  ASSERT_EQ(0, stat(logDir, &st));
  EXPECT_TRUE(S_ISDIR(st.st_mode));
  EXPECT_EQ(string(logDir), Log::Instance().GetLogDirectory());
  EXPECT_FALSE(Log::Instance().LogsToConsole());

  Log::Instance().Initialize("/tmp/kwclient.logging.other");
  EXPECT_EQ(string(logDir), Log::Instance().GetLogDirectory());
}

TEST_F(LoggingTest, SetLevelByName) {
  Log::Instance().SetLogLevel(" Warning ");
  EXPECT_EQ(LogLevel::Warn, Log::Instance().GetLogLevel());
  Info("dropped");
  Warning("kept");
  EXPECT_EQ(vector<string>(1, "[WARN] kept"), ReadLoggedLines());

  Log::Instance().SetLogLevel("no such level");
  EXPECT_EQ(LogLevel::Info, Log::Instance().GetLogLevel());
}

TEST_F(LoggingTest, LevelPrefix) {
  Info("upload started");
  Warning("chunk " << 3 << " retried");
  Error("upload failed");

  vector<string> expected;
  expected.push_back("[INFO] upload started");
  expected.push_back("[WARN] chunk 3 retried");
  expected.push_back("[ERROR] upload failed");
  EXPECT_EQ(expected, ReadLoggedLines());
}

TEST_F(LoggingTest, DebugMessagesNeedDebugOn) {
  DebugInfo("hidden info");
  DebugWarningIf(true, "hidden warning");
  Info("visible");

  Log::Instance().SetDebug(true);
  DebugInfo("request trace");
  DebugErrorIf(false, "skipped");
  DebugErrorIf(true, "response trace");

  vector<string> expected;
  expected.push_back("[INFO] visible");
  expected.push_back("[INFO] request trace");
  expected.push_back("[ERROR] response trace");
  EXPECT_EQ(expected, ReadLoggedLines());
}

TEST_F(LoggingTest, LevelFiltersMessages) {
  Log::Instance().SetLogLevel(LogLevel::Error);
  EXPECT_EQ(LogLevel::Error, Log::Instance().GetLogLevel());
  Info("dropped info");
  WarningIf(true, "dropped warning");
  ErrorIf(true, "kept error");

  vector<string> expected(1, "[ERROR] kept error");
  EXPECT_EQ(expected, ReadLoggedLines());
}

TEST(LoggingDeathTest, FatalTerminates) {
  EXPECT_DEATH(Fatal("token store lost"), "\\[FATAL\\] token store lost");
  EXPECT_DEATH(FatalIf(true, "bad state"), "\\[FATAL\\] bad state");
}

TEST(LoggingDeathTest, GatedFatalDoesNotTerminate) {
  Log::Instance().SetDebug(false);
  DebugFatal("not debugging");
  FatalIf(false, "condition false");
  DebugFatalIf(true, "not debugging either");
  SUCCEED();
}

}  // namespace Logging
}  // namespace KW

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
