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

#include "client/AuthSession.h"

#include <stdint.h>
#include <string.h>
#include <time.h>

#include <sstream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/TimeUtils.h"
#include "client/Constants.h"
#include "client/Types.h"
#include "client/Utils.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

using boost::property_tree::ptree;
using boost::shared_ptr;
using boost::to_string;
using KW::Configure::Default::GetDefaultAgentString;
using KW::Configure::Default::GetDefaultAPIVersion;
using KW::Exception::ConfigurationException;
using std::string;

namespace {

const char *const SIGNATURE_SEPARATOR = "|@@|";

void AttachToken(const AuthToken &token, Http::HttpRequest *request) {
  request->SetHeader("Authorization", "Bearer " + token.accessToken);
}

string NewNonce() {
  string bytes = KW::HashUtils::RandomBytes(4);
  uint32_t value = 0;
  memcpy(&value, bytes.data(), sizeof(value));
  return to_string(value % 999999 + 1);
}

}  // namespace

// --------------------------------------------------------------------------
AuthSession::AuthSession(const ClientConfiguration &config,
                         const string &username)
    : m_config(config), m_username(username) {
  if (!m_config.GetTokenStore()) {
    throw ConfigurationException("Token store is not set");
  }
  if (!m_config.GetHttpClientFactory()) {
    throw ConfigurationException("Http client factory is not set");
  }
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::NewRequest(
    Http::HttpMethod::Value method, const string &path, int apiVersion,
    Http::HttpRequest *request) const {
  if (apiVersion == 0) {
    apiVersion = GetDefaultAPIVersion();
  }
  const string &agent = m_config.GetAgentString().empty()
                            ? GetDefaultAgentString()
                            : m_config.GetAgentString();

  request->method = method;
  request->host = m_config.GetHost();
  request->path = path;
  request->SetHeader(Constants::APIVersionHeader, to_string(apiVersion));
  request->SetHeader("User-Agent", agent);
  request->SetHeader("Referer", "https://" + m_config.GetHost() + "/");

  return SetToken(request, false);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::SetToken(Http::HttpRequest *request,
                                                  bool forceNew) const {
  AuthToken token;
  ClientError<KWError::Value> err =
      m_config.GetTokenStore()->Load(m_username, &token);
  if (!IsGoodKWError(err)) {
    return err;
  }

  if (!token.IsEmpty() && !forceNew &&
      !KW::TimeUtils::IsExpired(token.expires)) {
    AttachToken(token, request);
    return ClientError<KWError::Value>();
  }

  if (!token.refreshToken.empty()) {
    AuthToken fresh;
    err = RefreshToken(token, &fresh);
    if (IsGoodKWError(err)) {
      return SaveAndAttach(fresh, request);
    }
    DebugWarning("Unable to refresh token of " << m_username << ": "
                                               << GetMessageForKWError(err));
    ClientError<KWError::Value> deleted =
        m_config.GetTokenStore()->Delete(m_username);
    if (!IsGoodKWError(deleted)) {
      return deleted;
    }
  }

  if (m_config.GetCredentials().HasSignatureKey()) {
    AuthToken minted;
    err = NewSignatureToken(&minted);
    if (!IsGoodKWError(err)) {
      return err;
    }
    return SaveAndAttach(minted, request);
  }

  return MakeKWError(KWError::NO_AUTH_TOKEN,
                     "No access token for " + m_username +
                         ", authentication required");
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::Reauthenticate(
    Http::HttpRequest *request,
    const ClientError<KWError::Value> &cause) const {
  if (m_config.GetCredentials().HasSignatureKey()) {
    return SetToken(request, cause.GetAPIError().IsTokenError());
  }

  const shared_ptr<TokenStore> &store = m_config.GetTokenStore();
  AuthToken existing;
  ClientError<KWError::Value> err = store->Load(m_username, &existing);
  if (!IsGoodKWError(err)) {
    return err;
  }

  if (!existing.refreshToken.empty()) {
    AuthToken fresh;
    err = RefreshToken(existing, &fresh);
    if (IsGoodKWError(err)) {
      return SaveAndAttach(fresh, request);
    }
    DebugWarning("Unable to refresh token of " << m_username << ": "
                                               << GetMessageForKWError(err));
    ClientError<KWError::Value> deleted =
        m_config.GetTokenStore()->Delete(m_username);
    if (!IsGoodKWError(deleted)) {
      return deleted;
    }
  }

  ClientError<KWError::Value> deleted = store->Delete(m_username);
  ErrorIf(!IsGoodKWError(deleted),
          "Unable to delete token of " << m_username << ": "
                                       << GetMessageForKWError(deleted));
  throw ConfigurationException("Token is no longer valid: " +
                               cause.GetMessage());
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::RefreshToken(
    const AuthToken &token, AuthToken *newToken) const {
  if (token.refreshToken.empty()) {
    return MakeKWError(KWError::NO_AUTH_TOKEN,
                       "No refresh token for " + m_username);
  }
  PostForm form;
  form.Set("grant_type", "refresh_token")
      .Set("refresh_token", token.refreshToken);
  return RequestToken(form, newToken);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::Login(const string &password) const {
  PostForm form;
  form.Set("grant_type", "password")
      .Set("username", m_username)
      .Set("password", password);

  AuthToken token;
  ClientError<KWError::Value> err = RequestToken(form, &token);
  if (!IsGoodKWError(err)) {
    return err;
  }
  return m_config.GetTokenStore()->Save(m_username, token);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::NewSignatureToken(
    AuthToken *token) const {
  if (!m_config.GetCredentials().HasSignatureKey()) {
    return MakeKWError(KWError::PARAMETER, "No signature key");
  }
  const string &appId = m_config.GetApplicationId();
  string timestamp = to_string(static_cast<int64_t>(time(NULL)));
  string nonce = NewNonce();

  std::ostringstream base;
  base << appId << SIGNATURE_SEPARATOR << m_username << SIGNATURE_SEPARATOR
       << timestamp << SIGNATURE_SEPARATOR << nonce;
  string signature = KW::HashUtils::HmacSHA1Hex(
      m_config.GetCredentials().GetSignatureKey(), base.str());

  std::ostringstream code;
  code << KW::HashUtils::Base64Encode(appId) << SIGNATURE_SEPARATOR
       << KW::HashUtils::Base64Encode(m_username) << SIGNATURE_SEPARATOR
       << timestamp << SIGNATURE_SEPARATOR << nonce << SIGNATURE_SEPARATOR
       << signature;

  PostForm form;
  form.Set("grant_type", "authorization_code").Set("code", code.str());
  return RequestToken(form, token);
}

// --------------------------------------------------------------------------
shared_ptr<Http::HttpClient> AuthSession::NewClient(bool streaming) const {
  return m_config.GetHttpClientFactory()->MakeClient(
      m_config.GetTransportOptions(streaming));
}

// --------------------------------------------------------------------------
void AuthSession::TraceRequest(const Http::HttpRequest &request,
                               const RequestParams &params) const {
  if (!m_config.IsTrace()) {
    return;
  }
  Info("[kiteworks]: " << m_username);
  Info("--> METHOD: \"" << Http::HttpMethodToString(request.method)
                        << "\" PATH: \"" << request.path << "\"");
  string described = params.Describe();
  InfoIf(!described.empty(), "\\-> " << described);
}

// --------------------------------------------------------------------------
void AuthSession::TraceResponse(const Http::HttpResponse &response) const {
  if (!m_config.IsTrace()) {
    return;
  }
  Info("<-- RESPONSE STATUS: " << response.statusCode);
  InfoIf(!response.body.empty(), Utils::RedactSecrets(response.body));
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::RequestToken(PostForm form,
                                                      AuthToken *token) const {
  form.Set("client_id", m_config.GetApplicationId())
      .Set("client_secret", m_config.GetCredentials().GetClientSecret())
      .Set("redirect_uri", m_config.GetRedirectURI());
  RequestParams params;
  params.Add(form);

  Http::HttpRequest request;
  request.method = Http::HttpMethod::Post;
  request.host = m_config.GetHost();
  request.path = Constants::OAuthTokenPath;
  request.SetHeader("User-Agent", m_config.GetAgentString().empty()
                                      ? GetDefaultAgentString()
                                      : m_config.GetAgentString());
  request.SetHeader("Referer", "https://" + m_config.GetHost() + "/");
  ClientError<KWError::Value> err = params.Encode(&request);
  if (!IsGoodKWError(err)) {
    return err;
  }

  TraceRequest(request, params);
  Http::HttpResponse response;
  err = NewClient(false)->Send(request, &response);
  if (!IsGoodKWError(err)) {
    return err;
  }
  TraceResponse(response);

  if (!Http::IsSuccessStatus(response.statusCode)) {
    return GetKWErrorForResponse(response, m_config.GetHost());
  }

  ptree tree;
  try {
    std::istringstream in(response.body);
    boost::property_tree::read_json(in, tree);
  } catch (const boost::property_tree::json_parser_error &ex) {
    return MakeKWError(KWError::DECODE, "I cannot understand what " +
                                            m_config.GetHost() +
                                            " is saying: " + ex.what());
  }
  err = Decode(tree, token);
  if (!IsGoodKWError(err)) {
    return err;
  }
  if (token->IsEmpty()) {
    return MakeKWError(KWError::PROTOCOL,
                       "No access token in response from " +
                           m_config.GetHost());
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> AuthSession::SaveAndAttach(
    const AuthToken &token, Http::HttpRequest *request) const {
  ClientError<KWError::Value> err =
      m_config.GetTokenStore()->Save(m_username, token);
  if (!IsGoodKWError(err)) {
    return err;
  }
  DebugInfoIf(token.expires != 0,
              "Token of " << m_username << " expires at "
                          << KW::TimeUtils::SecondsToKWTime(token.expires));
  AttachToken(token, request);
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
