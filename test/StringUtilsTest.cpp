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

#include <stdint.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/StringUtils.h"

using std::string;
using std::vector;

TEST(StringUtilsTest, ChangeCase) {
  string lowercase = "lowercase";
  EXPECT_EQ(lowercase, KW::StringUtils::ToLower("LOWerCase"));

  string uppercase = "UPPERCASE";
  EXPECT_EQ(uppercase, KW::StringUtils::ToUpper("UpperCase"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "    hello world    ";
  string notrailing = "    hello world";
  string noleading = "hello world    ";
  string noboth = "hello world";
  char ch = ' ';

  EXPECT_EQ(notrailing, KW::StringUtils::RTrim(raw, ch));
  EXPECT_EQ(noleading, KW::StringUtils::LTrim(raw, ch));
  EXPECT_EQ(noboth, KW::StringUtils::Trim(raw, ch));
}

TEST(StringUtilsTest, Join) {
  using KW::StringUtils::Join;
  vector<string> strs;
  EXPECT_EQ(string(), Join(strs, ","));
  strs.push_back("id");
  EXPECT_EQ(string("id"), Join(strs, ","));
  strs.push_back("name");
  strs.push_back("size");
  EXPECT_EQ(string("id,name,size"), Join(strs, ","));
}

TEST(StringUtilsTest, ReplaceAll) {
  using KW::StringUtils::ReplaceAll;
  EXPECT_EQ(string("a-b-c"), ReplaceAll("a+b+c", "+", "-"));
  EXPECT_EQ(string("abc"), ReplaceAll("abc", "", "-"));
  EXPECT_EQ(string("\\\\x"), ReplaceAll("\\x", "\\", "\\\\"));
}

TEST(StringUtilsTest, HumanSize) {
  using KW::StringUtils::HumanSize;
  EXPECT_EQ(string("0.0Bytes"), HumanSize(0));
  EXPECT_EQ(string("999.0Bytes"), HumanSize(999));
  EXPECT_EQ(string("1.5KB"), HumanSize(1500));
  EXPECT_EQ(string("100.0MB"), HumanSize(100000000));
  EXPECT_EQ(string("2.5GB"), HumanSize(static_cast<int64_t>(2500000000LL)));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
