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

#ifndef DISABLE_KWCLIENT_LOGGING
#define DISABLE_KWCLIENT_LOGGING
#endif

#include "gtest/gtest.h"

#include "base/LogMacros.h"
#include "base/Logging.h"

namespace {

int evaluated = 0;

int Touch() { return ++evaluated; }

}  // namespace

TEST(LogMacrosDisabledTest, MessagesAreNotEvaluated) {
  KW::Logging::Log::Instance().SetDebug(true);
  Info("info " << Touch());
  Warning(Touch());
  Error(Touch());
  InfoIf(Touch() > 0, Touch());
  DebugInfo(Touch());
  DebugErrorIf(true, Touch());
  EXPECT_EQ(0, evaluated);
  EXPECT_EQ(1, Touch());
  KW::Logging::Log::Instance().SetDebug(false);
}

TEST(LogMacrosDisabledTest, FatalIsCompiledOut) {
  Fatal("not fatal when logging is disabled");
  FatalIf(true, "nor this");
  DebugFatal("nor this");
  SUCCEED();
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
