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

#include "boost/shared_ptr.hpp"

#include "gtest/gtest.h"

#include "client/Http.h"
#include "client/KWError.h"
#include "client/RequestParams.h"

namespace {

using KW::Client::ClientError;
using KW::Client::KWError;
using KW::Client::ParamValue;
using KW::Client::ParamValueToString;
using KW::Client::PostForm;
using KW::Client::PostJSON;
using KW::Client::Query;
using KW::Client::RequestParams;
using KW::Client::Http::HttpRequest;
using KW::Client::Http::StringBody;
using std::string;
using std::vector;

string BodyOf(const HttpRequest &request) {
  boost::shared_ptr<StringBody> body =
      boost::dynamic_pointer_cast<StringBody>(request.body);
  return body ? body->GetContent() : string();
}

}  // namespace

TEST(RequestParamsTest, ValueToString) {
  EXPECT_EQ(string("abc"), ParamValueToString(ParamValue(string("abc"))));
  EXPECT_EQ(string("-12"),
            ParamValueToString(ParamValue(static_cast<int64_t>(-12))));
  EXPECT_EQ(string("true"), ParamValueToString(ParamValue(true)));
  EXPECT_EQ(string("false"), ParamValueToString(ParamValue(false)));

  vector<string> names;
  names.push_back("id");
  names.push_back("name");
  EXPECT_EQ(string("id,name"), ParamValueToString(ParamValue(names)));

  vector<int64_t> ids;
  ids.push_back(1);
  ids.push_back(2);
  ids.push_back(3);
  EXPECT_EQ(string("1,2,3"), ParamValueToString(ParamValue(ids)));
}

TEST(RequestParamsTest, SetReplacesExistingKey) {
  Query query;
  query.Set("limit", 1).Set("offset", 0).Set("limit", 5);
  ASSERT_EQ(2u, query.GetEntries().size());
  EXPECT_EQ(string("limit"), query.GetEntries()[0].first);
  EXPECT_EQ(string("5"), ParamValueToString(query.GetEntries()[0].second));
}

TEST(RequestParamsTest, EncodeQueryAndForm) {
  RequestParams params;
  params.Add(Query().Set("returnEntity", true))
      .Add(PostForm().Set("grant_type", "password").Set("username", "a b"));
  ASSERT_TRUE(params.IsValid());
  EXPECT_TRUE(params.HasBody());

  HttpRequest request;
  ClientError<KWError::Value> err = params.Encode(&request);
  ASSERT_TRUE(KW::Client::IsGoodKWError(err));
  ASSERT_EQ(1u, request.query.size());
  EXPECT_EQ(string("returnEntity"), request.query[0].first);
  EXPECT_EQ(string("true"), request.query[0].second);
  EXPECT_EQ(string("application/x-www-form-urlencoded"),
            request.GetHeader("Content-Type"));
  EXPECT_EQ(string("grant_type=password&username=a+b"), BodyOf(request));
}

TEST(RequestParamsTest, EncodeJSON) {
  RequestParams params;
  params.Add(PostJSON()
                 .Set("filename", "say \"hi\".txt")
                 .Set("totalSize", static_cast<int64_t>(5))
                 .Set("totalChunks", 1));

  HttpRequest request;
  ASSERT_TRUE(KW::Client::IsGoodKWError(params.Encode(&request)));
  EXPECT_EQ(string("application/json"), request.GetHeader("Content-Type"));
  EXPECT_EQ(string("{\"filename\":\"say \\\"hi\\\".txt\",\"totalSize\":5,"
                   "\"totalChunks\":1}"),
            BodyOf(request));
}

TEST(RequestParamsTest, JSONLists) {
  vector<string> names;
  names.push_back("a");
  names.push_back("b");
  vector<int64_t> ids;
  ids.push_back(7);
  PostJSON json;
  json.Set("names", names).Set("ids", ids).Set("flag", false);
  string content;
  ASSERT_TRUE(KW::Client::IsGoodKWError(
      KW::Client::ParamEntriesToJSON(json.GetEntries(), &content)));
  EXPECT_EQ(string("{\"names\":[\"a\",\"b\"],\"ids\":[7],\"flag\":false}"),
            content);
}

TEST(RequestParamsTest, JSONRejectsInvalidUTF8) {
  RequestParams params;
  params.Add(Query().Set("returnEntity", true))
      .Add(PostJSON().Set("filename", string("bad\xff.txt")));

  HttpRequest request;
  ClientError<KWError::Value> err = params.Encode(&request);
  EXPECT_EQ(KWError::PARAMETER, err.GetError());
  EXPECT_FALSE(request.body);

  PostJSON utf8;
  utf8.Set("filename", string("caf\xc3\xa9.txt"));
  string content;
  ASSERT_TRUE(KW::Client::IsGoodKWError(
      KW::Client::ParamEntriesToJSON(utf8.GetEntries(), &content)));
  EXPECT_EQ(string("{\"filename\":\"caf\xc3\xa9.txt\"}"), content);
}

TEST(RequestParamsTest, SecondBodyIsInvalid) {
  RequestParams params;
  params.Add(PostForm().Set("a", "1")).Add(PostJSON().Set("b", "2"));
  EXPECT_FALSE(params.IsValid());
  EXPECT_EQ(string("Only one of PostForm or PostJSON can be set for a request"),
            params.GetValidationError());

  HttpRequest request;
  ClientError<KWError::Value> err = params.Encode(&request);
  EXPECT_EQ(KWError::PARAMETER, err.GetError());
  EXPECT_FALSE(request.body);
}

TEST(RequestParamsTest, SeveralQueriesAreFine) {
  RequestParams params;
  params.Add(Query().Set("a", 1)).Add(Query().Set("b", 2));
  EXPECT_TRUE(params.IsValid());
  EXPECT_FALSE(params.HasBody());

  HttpRequest request;
  ASSERT_TRUE(KW::Client::IsGoodKWError(params.Encode(&request)));
  EXPECT_EQ(2u, request.query.size());
  EXPECT_FALSE(request.body);
}

TEST(RequestParamsTest, DescribeHidesSecrets) {
  RequestParams params;
  params.Add(Query().Set("limit", 1).Set("offset", 10))
      .Add(PostForm()
               .Set("grant_type", "refresh_token")
               .Set("refresh_token", "very-secret"));
  EXPECT_EQ(string("Query: limit=1, offset=10\n"
                   "PostForm: grant_type=refresh_token, "
                   "refresh_token=[HIDDEN]"),
            params.Describe());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
