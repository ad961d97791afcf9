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

#include <istream>
#include <sstream>
#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "gtest/gtest.h"

#include "client/Client.h"
#include "client/ClientConfiguration.h"
#include "client/KWError.h"
#include "client/TokenStore.h"
#include "client/Types.h"
#include "FakeHttpClient.h"

namespace {

using boost::shared_ptr;
using KW::Client::APIRequest;
using KW::Client::AuthToken;
using KW::Client::ClientConfiguration;
using KW::Client::ClientError;
using KW::Client::FileInfo;
using KW::Client::IsGoodKWError;
using KW::Client::KWError;
using KW::Client::MemoryTokenStore;
using KW::Client::Http::FakeHttpClientFactory;
using KW::Client::Http::HttpMethod;
using std::string;

const char *const USER = "erin@example.com";

class ClientTest : public ::testing::Test {
 protected:
  void SetUp() {
    m_factory = boost::make_shared<FakeHttpClientFactory>();
    m_store = boost::make_shared<MemoryTokenStore>();
    m_config.SetHost("kw.example.com");
    m_config.SetApplicationId("app-id");
    m_config.SetClientSecret("client-secret");
    m_config.SetRetryBackoffUnit(1);
    m_config.SetHttpClientFactory(m_factory);
    m_config.SetTokenStore(m_store);
  }

  ClientConfiguration m_config;
  shared_ptr<FakeHttpClientFactory> m_factory;
  shared_ptr<MemoryTokenStore> m_store;
};

}  // namespace

TEST_F(ClientTest, CallNeedsLogin) {
  KW::Client::Client client(m_config, USER);
  ClientError<KWError::Value> err =
      client.Call(APIRequest(HttpMethod::Get, "/rest/users/me"));
  EXPECT_EQ(KWError::NO_AUTH_TOKEN, err.GetError());
  EXPECT_TRUE(m_factory->GetSentRequests().empty());
}

TEST_F(ClientTest, LoginUploadDownload) {
  KW::Client::Client client(m_config, USER);

  m_factory->PushReply(200,
                       "{\"access_token\": \"t1\", \"refresh_token\": \"r1\", "
                       "\"expires_in\": 3600}");
  ClientError<KWError::Value> err = client.Login("secret");
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  AuthToken token;
  m_store->Load(USER, &token);
  EXPECT_EQ(string("t1"), token.accessToken);

  m_factory->PushReply(201, "{\"id\": 70}");
  int64_t uploadId = 0;
  err = client.NewUpload(3, "hello.txt", 5, &uploadId);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(70, uploadId);

  m_factory->PushReply(
      200,
      "{\"data\": [{\"id\": 70, \"totalSize\": 5, \"totalChunks\": 1, "
      "\"uploadedChunks\": 0, \"uploadedSize\": 0, \"finished\": false, "
      "\"uri\": \"rest/uploads/70\", \"fileId\": 0}]}");
  m_factory->PushReply(201, "{\"id\": 71}");
  std::istringstream source("hello");
  int64_t fileId = 0;
  err = client.Upload("hello.txt", uploadId, &source, &fileId);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(71, fileId);

  m_factory->PushReply(200,
                       "{\"id\": 71, \"name\": \"hello.txt\", \"size\": 5}");
  m_factory->PushReply(200, "hello");
  shared_ptr<std::istream> stream;
  FileInfo info;
  err = client.Download(fileId, &stream, &info);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(5, info.size);
  string content;
  std::getline(*stream, content);
  EXPECT_EQ(string("hello"), content);

  EXPECT_EQ(0u, m_factory->GetPendingReplies());
  EXPECT_EQ(6u, m_factory->GetSentRequests().size());
  EXPECT_EQ(string("Bearer t1"), m_factory->GetSentRequests()
                                     .back()
                                     .request.GetHeader("Authorization"));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
