// +-------------------------------------------------------------------------
// | Copyright (C) 2018 Yunify, Inc.
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

#include <string>

#include "gtest/gtest.h"

#include "base/Logging.h"

namespace {

using KW::Logging::GetLogLevelByName;
using KW::Logging::GetLogLevelName;
using KW::Logging::GetLogLevelPrefix;
using KW::Logging::LogLevel;
using std::string;

}  // namespace

TEST(LogLevelTest, NameOfEveryLevelParsesBack) {
  for (int i = LogLevel::Info; i <= LogLevel::Fatal; ++i) {
    LogLevel::Value level = static_cast<LogLevel::Value>(i);
    string name = GetLogLevelName(level);
    EXPECT_FALSE(name.empty());
    EXPECT_EQ(level, GetLogLevelByName(name)) << name;
  }
  EXPECT_EQ(string("WARN"), GetLogLevelName(LogLevel::Warn));
}

TEST(LogLevelTest, OutOfRangeLevelHasNoName) {
  EXPECT_EQ(string(), GetLogLevelName(static_cast<LogLevel::Value>(7)));
  EXPECT_EQ(string(), GetLogLevelName(static_cast<LogLevel::Value>(-1)));
}

TEST(LogLevelTest, ParseIgnoresCaseAndSpaces) {
  EXPECT_EQ(LogLevel::Error, GetLogLevelByName("  error "));
  EXPECT_EQ(LogLevel::Fatal, GetLogLevelByName("Fatal"));
  EXPECT_EQ(LogLevel::Warn, GetLogLevelByName(" Warning"));
  EXPECT_EQ(LogLevel::Warn, GetLogLevelByName("wArN"));
}

TEST(LogLevelTest, UnknownNameFallsBackToInfo) {
  EXPECT_EQ(LogLevel::Info, GetLogLevelByName("verbose"));
  EXPECT_EQ(LogLevel::Info, GetLogLevelByName(""));
  EXPECT_EQ(LogLevel::Info, GetLogLevelByName("err or"));
}

TEST(LogLevelTest, Prefix) {
  EXPECT_EQ(string("[INFO] "), GetLogLevelPrefix(LogLevel::Info));
  EXPECT_EQ(string("[FATAL] "), GetLogLevelPrefix(LogLevel::Fatal));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
