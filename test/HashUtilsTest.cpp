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

#include <string>

#include "gtest/gtest.h"

#include "base/HashUtils.h"

using std::string;

TEST(HashUtilsTest, HmacSHA1Hex) {
  EXPECT_EQ(string("effcdf6ae5eb2fa2d27416d5f184df9c259a7c79"),
            KW::HashUtils::HmacSHA1Hex("Jefe", "what do ya want for nothing?"));
}

TEST(HashUtilsTest, Base64Encode) {
  using KW::HashUtils::Base64Encode;
  EXPECT_EQ(string(), Base64Encode(""));
  EXPECT_EQ(string("aGVsbG8="), Base64Encode("hello"));
  EXPECT_EQ(string("YXBwLWlk"), Base64Encode("app-id"));
}

TEST(HashUtilsTest, Random) {
  string bytes = KW::HashUtils::RandomBytes(32);
  EXPECT_EQ(32u, bytes.size());

  string hex = KW::HashUtils::RandomHex(16);
  EXPECT_EQ(32u, hex.size());
  EXPECT_EQ(string::npos, hex.find_first_not_of("0123456789abcdef"));
  EXPECT_NE(hex, KW::HashUtils::RandomHex(16));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
