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

#include <stdlib.h>
#include <time.h>

#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/HashUtils.h"
#include "base/StringUtils.h"
#include "client/AuthSession.h"
#include "client/ClientConfiguration.h"
#include "client/Http.h"
#include "client/KWError.h"
#include "client/TokenStore.h"
#include "FakeHttpClient.h"

namespace {

using boost::shared_ptr;
using KW::Client::AuthSession;
using KW::Client::AuthToken;
using KW::Client::ClientConfiguration;
using KW::Client::ClientError;
using KW::Client::IsGoodKWError;
using KW::Client::KWError;
using KW::Client::MemoryTokenStore;
using KW::Client::TokenStore;
using KW::Client::Http::FakeHttpClientFactory;
using KW::Client::Http::HttpMethod;
using KW::Client::Http::HttpRequest;
using KW::Client::Http::SentRequest;
using KW::Exception::ConfigurationException;
using std::string;
using std::vector;

const char *const USER = "bob@example.com";

vector<string> SplitBy(const string &str, const string &sep) {
  vector<string> parts;
  string::size_type start = 0;
  string::size_type pos = 0;
  while ((pos = str.find(sep, start)) != string::npos) {
    parts.push_back(str.substr(start, pos - start));
    start = pos + sep.size();
  }
  parts.push_back(str.substr(start));
  return parts;
}

// Form value as sent, with the separators of a signature code decoded
string FormValue(const string &body, const string &key) {
  vector<string> pairs = SplitBy(body, "&");
  for (size_t i = 0; i < pairs.size(); ++i) {
    if (pairs[i].compare(0, key.size() + 1, key + "=") == 0) {
      return KW::StringUtils::ReplaceAll(pairs[i].substr(key.size() + 1),
                                         "%7C%40%40%7C", "|@@|");
    }
  }
  return string();
}

class AuthSessionTest : public ::testing::Test {
 protected:
  void SetUp() {
    m_factory = boost::make_shared<FakeHttpClientFactory>();
    m_store = boost::make_shared<MemoryTokenStore>();
    m_config.SetHost("kw.example.com");
    m_config.SetApplicationId("app-id");
    m_config.SetRedirectURI("https://kw.example.com/rest/callback.html");
    m_config.SetClientSecret("client-secret");
    m_config.SetHttpClientFactory(m_factory);
    m_config.SetTokenStore(m_store);
  }

  void StoreToken(const string &access, const string &refresh,
                  time_t expires) {
    AuthToken token;
    token.accessToken = access;
    token.refreshToken = refresh;
    token.expires = expires;
    ASSERT_TRUE(IsGoodKWError(m_store->Save(USER, token)));
  }

  AuthToken StoredToken() {
    AuthToken token;
    EXPECT_TRUE(IsGoodKWError(m_store->Load(USER, &token)));
    return token;
  }

  ClientConfiguration m_config;
  shared_ptr<FakeHttpClientFactory> m_factory;
  shared_ptr<MemoryTokenStore> m_store;
};

}  // namespace

TEST_F(AuthSessionTest, MissingCollaborators) {
  ClientConfiguration config(m_config);
  config.SetTokenStore(shared_ptr<TokenStore>());
  EXPECT_THROW(AuthSession session(config, USER), ConfigurationException);

  ClientConfiguration noFactory(m_config);
  noFactory.SetHttpClientFactory(
      shared_ptr<KW::Client::Http::HttpClientFactory>());
  EXPECT_THROW(AuthSession session(noFactory, USER), ConfigurationException);
}

TEST_F(AuthSessionTest, NewRequestWithStoredToken) {
  StoreToken("a1", "r1", time(NULL) + 3600);
  AuthSession session(m_config, USER);

  HttpRequest request;
  ClientError<KWError::Value> err =
      session.NewRequest(HttpMethod::Get, "/rest/files/7", 0, &request);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(HttpMethod::Get, request.method);
  EXPECT_EQ(string("https://kw.example.com/rest/files/7"), request.GetURL());
  EXPECT_EQ(string("11"), request.GetHeader("X-Accellion-Version"));
  EXPECT_EQ(string("kwclient/1.0"), request.GetHeader("User-Agent"));
  EXPECT_EQ(string("https://kw.example.com/"), request.GetHeader("Referer"));
  EXPECT_EQ(string("Bearer a1"), request.GetHeader("Authorization"));
  EXPECT_TRUE(m_factory->GetSentRequests().empty());

  HttpRequest versioned;
  ASSERT_TRUE(IsGoodKWError(
      session.NewRequest(HttpMethod::Post, "/rest/uploads", 5, &versioned)));
  EXPECT_EQ(string("5"), versioned.GetHeader("X-Accellion-Version"));
}

TEST_F(AuthSessionTest, ExpiredTokenIsRefreshed) {
  StoreToken("a1", "r1", time(NULL) - 10);
  m_factory->PushReply(
      200,
      "{\"access_token\": \"a2\", \"refresh_token\": \"r2\", "
      "\"expires_in\": 3600}");
  AuthSession session(m_config, USER);

  HttpRequest request;
  ClientError<KWError::Value> err =
      session.NewRequest(HttpMethod::Get, "/rest/users/me", 0, &request);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(string("Bearer a2"), request.GetHeader("Authorization"));

  ASSERT_EQ(1u, m_factory->GetSentRequests().size());
  const SentRequest &sent = m_factory->GetSentRequests()[0];
  EXPECT_EQ(HttpMethod::Post, sent.request.method);
  EXPECT_EQ(string("/oauth/token"), sent.request.path);
  EXPECT_EQ(string("refresh_token"), FormValue(sent.body, "grant_type"));
  EXPECT_EQ(string("r1"), FormValue(sent.body, "refresh_token"));
  EXPECT_EQ(string("app-id"), FormValue(sent.body, "client_id"));
  EXPECT_EQ(string("client-secret"), FormValue(sent.body, "client_secret"));
  EXPECT_EQ(60000u, sent.options.requestTimeout);

  AuthToken stored = StoredToken();
  EXPECT_EQ(string("a2"), stored.accessToken);
  EXPECT_EQ(string("r2"), stored.refreshToken);
  EXPECT_GT(stored.expires, time(NULL));
}

TEST_F(AuthSessionTest, RejectedRefreshDropsStoredToken) {
  StoreToken("a1", "r1", time(NULL) - 10);
  m_factory->PushReply(
      400, "{\"error\": \"invalid_grant\", "
           "\"error_description\": \"Refresh token expired\"}");
  AuthSession session(m_config, USER);

  HttpRequest request;
  ClientError<KWError::Value> err =
      session.NewRequest(HttpMethod::Get, "/rest/users/me", 0, &request);
  EXPECT_EQ(KWError::NO_AUTH_TOKEN, err.GetError());
  EXPECT_FALSE(request.HasHeader("Authorization"));
  EXPECT_TRUE(StoredToken().IsEmpty());

  // nothing left to refresh, so no second token request
  HttpRequest again;
  err = session.NewRequest(HttpMethod::Get, "/rest/users/me", 0, &again);
  EXPECT_EQ(KWError::NO_AUTH_TOKEN, err.GetError());
  EXPECT_EQ(1u, m_factory->GetSentRequests().size());
}

TEST_F(AuthSessionTest, NoTokenAndNoSignatureKey) {
  AuthSession session(m_config, USER);
  HttpRequest request;
  ClientError<KWError::Value> err =
      session.NewRequest(HttpMethod::Get, "/rest/users/me", 0, &request);
  EXPECT_EQ(KWError::NO_AUTH_TOKEN, err.GetError());
  EXPECT_EQ(string("No access token for bob@example.com, "
                   "authentication required"),
            err.GetMessage());
  EXPECT_FALSE(request.HasHeader("Authorization"));
  EXPECT_TRUE(m_factory->GetSentRequests().empty());
}

TEST_F(AuthSessionTest, SignatureGrant) {
  m_config.SetSignatureKey("signature-key");
  m_factory->PushReply(200, "{\"access_token\": \"s1\", \"expires_in\": 60}");
  AuthSession session(m_config, USER);

  HttpRequest request;
  ClientError<KWError::Value> err =
      session.NewRequest(HttpMethod::Get, "/rest/users/me", 0, &request);
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(string("Bearer s1"), request.GetHeader("Authorization"));
  EXPECT_EQ(string("s1"), StoredToken().accessToken);

  ASSERT_EQ(1u, m_factory->GetSentRequests().size());
  const string &body = m_factory->GetSentRequests()[0].body;
  EXPECT_EQ(string("authorization_code"), FormValue(body, "grant_type"));

  vector<string> parts = SplitBy(FormValue(body, "code"), "|@@|");
  ASSERT_EQ(5u, parts.size());
  EXPECT_EQ(KW::HashUtils::Base64Encode("app-id"), parts[0]);
  EXPECT_EQ(KW::HashUtils::Base64Encode(USER), parts[1]);
  int nonce = atoi(parts[3].c_str());
  EXPECT_GE(nonce, 1);
  EXPECT_LE(nonce, 999999);
  string base = string("app-id|@@|") + USER + "|@@|" + parts[2] + "|@@|" +
                parts[3];
  EXPECT_EQ(KW::HashUtils::HmacSHA1Hex("signature-key", base), parts[4]);
}

TEST_F(AuthSessionTest, LoginSavesToken) {
  m_factory->PushReply(200,
                       "{\"access_token\": \"p1\", \"refresh_token\": \"pr1\"}");
  AuthSession session(m_config, USER);
  ClientError<KWError::Value> err = session.Login("hunter2");
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);

  const string &body = m_factory->GetSentRequests()[0].body;
  EXPECT_EQ(string("password"), FormValue(body, "grant_type"));
  EXPECT_EQ(string("hunter2"), FormValue(body, "password"));
  AuthToken stored = StoredToken();
  EXPECT_EQ(string("p1"), stored.accessToken);
  EXPECT_EQ(string("pr1"), stored.refreshToken);
  EXPECT_EQ(0, stored.expires);
}

TEST_F(AuthSessionTest, LoginRejected) {
  m_factory->PushReply(
      400, "{\"error\": \"invalid_grant\", \"error_description\": \"Bad\"}");
  AuthSession session(m_config, USER);
  ClientError<KWError::Value> err = session.Login("wrong");
  EXPECT_EQ(KWError::VENDOR_API, err.GetError());
  EXPECT_TRUE(err.GetAPIError().IsTokenError());
  EXPECT_TRUE(StoredToken().IsEmpty());
}

TEST_F(AuthSessionTest, MalformedTokenResponses) {
  AuthSession session(m_config, USER);

  m_factory->PushReply(200, "not json");
  EXPECT_EQ(KWError::DECODE, session.Login("pw").GetError());

  m_factory->PushReply(200, "{\"token_type\": \"bearer\"}");
  ClientError<KWError::Value> err = session.Login("pw");
  EXPECT_EQ(KWError::PROTOCOL, err.GetError());
  EXPECT_EQ(string("No access token in response from kw.example.com"),
            err.GetMessage());
}

TEST_F(AuthSessionTest, ReauthenticateRefreshes) {
  StoreToken("a1", "r1", 0);
  m_factory->PushReply(200,
                       "{\"access_token\": \"a2\", \"refresh_token\": \"r2\"}");
  AuthSession session(m_config, USER);

  HttpRequest request;
  request.SetHeader("Authorization", "Bearer a1");
  ClientError<KWError::Value> err = session.Reauthenticate(
      &request, KW::Client::MakeKWError(KWError::VENDOR_API, "expired"));
  ASSERT_TRUE(IsGoodKWError(err)) << GetMessageForKWError(err);
  EXPECT_EQ(string("Bearer a2"), request.GetHeader("Authorization"));
  EXPECT_EQ(string("a2"), StoredToken().accessToken);
}

TEST_F(AuthSessionTest, ReauthenticateFailureDeletesToken) {
  StoreToken("a1", "r1", 0);
  m_factory->PushReply(
      401, "{\"error\": \"invalid_grant\", \"error_description\": \"Gone\"}");
  AuthSession session(m_config, USER);

  HttpRequest request;
  EXPECT_THROW(
      session.Reauthenticate(
          &request, KW::Client::MakeKWError(KWError::VENDOR_API, "expired")),
      ConfigurationException);
  EXPECT_TRUE(StoredToken().IsEmpty());
}

TEST_F(AuthSessionTest, ReauthenticateWithoutRefreshToken) {
  StoreToken("a1", "", 0);
  AuthSession session(m_config, USER);
  HttpRequest request;
  EXPECT_THROW(
      session.Reauthenticate(
          &request, KW::Client::MakeKWError(KWError::VENDOR_API, "expired")),
      ConfigurationException);
  EXPECT_TRUE(m_factory->GetSentRequests().empty());
  EXPECT_TRUE(StoredToken().IsEmpty());
}

TEST_F(AuthSessionTest, StreamingClientOptions) {
  m_config.SetRequestTimeout(5000);
  AuthSession session(m_config, USER);
  KW::Client::Http::TransportOptions options =
      session.GetConfiguration().GetTransportOptions(true);
  EXPECT_EQ(0u, options.requestTimeout);
  EXPECT_EQ(5000u, options.readTimeout);
  EXPECT_TRUE(session.NewClient(true));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
