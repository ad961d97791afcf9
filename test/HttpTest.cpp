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
#include <utility>

#include "gtest/gtest.h"

#include "client/Http.h"

namespace {

using KW::Client::Http::BuildQueryString;
using KW::Client::Http::HttpRequest;
using KW::Client::Http::HttpResponse;
using KW::Client::Http::QueryList;
using KW::Client::Http::StringBody;
using KW::Client::Http::UrlEncode;
using std::string;

}  // namespace

TEST(HttpTest, UrlEncode) {
  EXPECT_EQ(string("abc-_.~123"), UrlEncode("abc-_.~123"));
  EXPECT_EQ(string("a+b"), UrlEncode("a b"));
  EXPECT_EQ(string("%2Frest%2Ffiles%3Fx%3D1%26y"),
            UrlEncode("/rest/files?x=1&y"));
  EXPECT_EQ(string("%28id%2Cname%29"), UrlEncode("(id,name)"));
  EXPECT_EQ(string("%E4%B8%AD"), UrlEncode("\xE4\xB8\xAD"));
}

TEST(HttpTest, BuildQueryString) {
  QueryList query;
  EXPECT_EQ(string(), BuildQueryString(query));
  query.push_back(std::make_pair("grant_type", "password"));
  query.push_back(std::make_pair("username", "a@b.com"));
  EXPECT_EQ(string("grant_type=password&username=a%40b.com"),
            BuildQueryString(query));
}

TEST(HttpTest, RequestURL) {
  HttpRequest request;
  request.host = "kw.example.com";
  request.path = "/rest/uploads";
  EXPECT_EQ(string("https://kw.example.com/rest/uploads"), request.GetURL());

  request.AddQuery("locate_id", "42");
  request.AddQuery("limit", "1");
  EXPECT_EQ(string("https://kw.example.com/rest/uploads?locate_id=42&limit=1"),
            request.GetURL());
}

TEST(HttpTest, HeadersAreCaseInsensitive) {
  HttpRequest request;
  request.SetHeader("Content-Type", "text/plain");
  EXPECT_TRUE(request.HasHeader("content-type"));
  request.SetHeader("CONTENT-TYPE", "application/json");
  EXPECT_EQ(1u, request.headers.size());
  EXPECT_EQ(string("application/json"), request.GetHeader("Content-Type"));
  EXPECT_FALSE(request.HasHeader("Range"));
  EXPECT_EQ(string(), request.GetHeader("Range"));

  HttpResponse response;
  response.headers["content-range"] = "bytes 10-19/20";
  EXPECT_EQ(string("bytes 10-19/20"), response.GetHeader("Content-Range"));
}

TEST(HttpTest, StatusClasses) {
  EXPECT_TRUE(KW::Client::Http::IsSuccessStatus(200));
  EXPECT_TRUE(KW::Client::Http::IsSuccessStatus(206));
  EXPECT_FALSE(KW::Client::Http::IsSuccessStatus(302));
  EXPECT_FALSE(KW::Client::Http::IsSuccessStatus(401));
}

TEST(HttpTest, StringBodyRewinds) {
  StringBody body("hello world", "text/plain");
  EXPECT_EQ(11, body.GetContentLength());
  char buf[8] = {0};
  size_t n = 0;
  ASSERT_TRUE(body.Read(buf, 5, &n));
  EXPECT_EQ(5u, n);
  EXPECT_EQ(string("hello"), string(buf, n));
  ASSERT_TRUE(body.Read(buf, sizeof(buf), &n));
  EXPECT_EQ(string(" world"), string(buf, n));
  ASSERT_TRUE(body.Read(buf, sizeof(buf), &n));
  EXPECT_EQ(0u, n);

  ASSERT_TRUE(body.Rewind());
  ASSERT_TRUE(body.Read(buf, 5, &n));
  EXPECT_EQ(string("hello"), string(buf, n));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
