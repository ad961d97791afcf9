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

#ifndef KWCLIENT_CLIENT_AUTHSESSION_H_
#define KWCLIENT_CLIENT_AUTHSESSION_H_

#include <string>

#include "boost/shared_ptr.hpp"

#include "client/ClientConfiguration.h"
#include "client/Http.h"
#include "client/HttpClient.h"
#include "client/KWError.h"
#include "client/RequestParams.h"
#include "client/TokenStore.h"

namespace KW {

namespace Client {

// --------------------------------------------------------------------------
//
// AuthSession
//
// A configuration bound to one user. Builds authenticated requests and owns
// the token life cycle: load from token store, refresh, mint through the
// signature grant, delete once refresh is no longer possible.
//
class AuthSession {
 public:
  AuthSession(const ClientConfiguration &config, const std::string &username);

 public:
  // Build a request with version, agent, referer and bearer token headers
  //
  // @param  : method, path beginning with '/', api version (0 for default)
  // @param  : output request
  // @return : error from attaching the token
  ClientError<KWError::Value> NewRequest(Http::HttpMethod::Value method,
                                         const std::string &path,
                                         int apiVersion,
                                         Http::HttpRequest *request) const;

  // Attach bearer token to request
  //
  // @param  : request, force a new token instead of the stored one
  // @return : NO_AUTH_TOKEN if neither stored token nor signature key works
  //
  // Stored token is used while it is not expired, an expired one is
  // refreshed first. With a signature key a missing or unusable token is
  // minted again.
  ClientError<KWError::Value> SetToken(Http::HttpRequest *request,
                                       bool forceNew) const;

  // Get a working token after a call failed with the given error
  //
  // @param  : request to attach the new token to, error of failed call
  // @return : error, e.g. token store failure
  //
  // Without a signature key, a token which cannot be refreshed is deleted
  // from the store and ConfigurationException is thrown.
  ClientError<KWError::Value> Reauthenticate(
      Http::HttpRequest *request,
      const ClientError<KWError::Value> &cause) const;

  // Exchange refresh token for a new token
  ClientError<KWError::Value> RefreshToken(const AuthToken &token,
                                           AuthToken *newToken) const;

  // Password grant, token is persisted on success
  ClientError<KWError::Value> Login(const std::string &password) const;

  // Signature grant with application signature key
  ClientError<KWError::Value> NewSignatureToken(AuthToken *token) const;

  // Transport for one exchange
  //
  // @param  : streaming, see ClientConfiguration::GetTransportOptions
  // @return : client
  boost::shared_ptr<Http::HttpClient> NewClient(bool streaming) const;

  // Log request line and parameters when tracing is enabled
  void TraceRequest(const Http::HttpRequest &request,
                    const RequestParams &params) const;
  // Log response status and body when tracing is enabled
  void TraceResponse(const Http::HttpResponse &response) const;

  const ClientConfiguration &GetConfiguration() const { return m_config; }
  const std::string &GetUsername() const { return m_username; }

 private:
  ClientError<KWError::Value> RequestToken(PostForm form,
                                           AuthToken *token) const;
  ClientError<KWError::Value> SaveAndAttach(const AuthToken &token,
                                            Http::HttpRequest *request) const;

 private:
  ClientConfiguration m_config;
  std::string m_username;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_AUTHSESSION_H_
