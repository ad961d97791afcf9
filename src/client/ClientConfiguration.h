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

#ifndef KWCLIENT_CLIENT_CLIENTCONFIGURATION_H_
#define KWCLIENT_CLIENT_CLIENTCONFIGURATION_H_

#include <stdint.h>

#include <string>

#include "boost/shared_ptr.hpp"

#include "client/Credentials.h"
#include "client/HttpClient.h"

namespace KW {

namespace Client {

class TokenStore;

//
// ClientConfiguration
//
// Settings of one session with the service. Built by the caller and only
// read once calls are in flight.
//
class ClientConfiguration {
 public:
  explicit ClientConfiguration(const std::string &host = std::string());

 public:
  // accessor
  const std::string &GetHost() const { return m_host; }
  const std::string &GetApplicationId() const { return m_applicationId; }
  const std::string &GetRedirectURI() const { return m_redirectURI; }
  const std::string &GetAgentString() const { return m_agentString; }
  bool IsVerifySSL() const { return m_verifySSL; }
  const std::string &GetProxyURI() const { return m_proxyURI; }
  bool IsTrace() const { return m_trace; }
  uint32_t GetRequestTimeout() const { return m_requestTimeout; }
  uint32_t GetConnectTimeout() const { return m_connectTimeout; }
  uint64_t GetMaxChunkSize() const { return m_maxChunkSize; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRetryBackoffUnit() const { return m_retryBackoffUnit; }
  const boost::shared_ptr<TokenStore> &GetTokenStore() const {
    return m_tokenStore;
  }
  const boost::shared_ptr<Http::HttpClientFactory> &GetHttpClientFactory()
      const {
    return m_httpClientFactory;
  }
  const Credentials &GetCredentials() const { return m_credentials; }

  // Transport settings for one exchange
  //
  // @param  : streaming, for chunk uploads and content downloads which have
  //           no overall deadline but a read timeout instead
  // @return : options
  Http::TransportOptions GetTransportOptions(bool streaming) const;

  // mutator
  void SetHost(const std::string &host) { m_host = host; }
  void SetApplicationId(const std::string &id) { m_applicationId = id; }
  void SetRedirectURI(const std::string &uri) { m_redirectURI = uri; }
  void SetAgentString(const std::string &agent) { m_agentString = agent; }
  void SetVerifySSL(bool verify) { m_verifySSL = verify; }
  void SetProxyURI(const std::string &proxy) { m_proxyURI = proxy; }
  void SetTrace(bool trace) { m_trace = trace; }
  void SetRequestTimeout(uint32_t ms) { m_requestTimeout = ms; }
  void SetConnectTimeout(uint32_t ms) { m_connectTimeout = ms; }
  void SetMaxChunkSize(uint64_t size) { m_maxChunkSize = size; }
  void SetRetries(uint16_t retries) { m_retries = retries; }
  void SetRetryBackoffUnit(uint32_t ms) { m_retryBackoffUnit = ms; }
  void SetTokenStore(const boost::shared_ptr<TokenStore> &store);
  void SetHttpClientFactory(
      const boost::shared_ptr<Http::HttpClientFactory> &factory);
  void SetClientSecret(const std::string &secret) {
    m_credentials.SetClientSecret(secret);
  }
  void SetSignatureKey(const std::string &key) {
    m_credentials.SetSignatureKey(key);
  }

 private:
  std::string m_host;
  std::string m_applicationId;
  std::string m_redirectURI;
  std::string m_agentString;
  bool m_verifySSL;
  std::string m_proxyURI;
  bool m_trace;                  // log requests and responses
  uint32_t m_requestTimeout;     // in milliseconds
  uint32_t m_connectTimeout;     // in milliseconds
  uint64_t m_maxChunkSize;       // 0 for the largest allowed
  uint16_t m_retries;            // attempts beyond the first one
  uint32_t m_retryBackoffUnit;   // in milliseconds
  boost::shared_ptr<TokenStore> m_tokenStore;
  boost::shared_ptr<Http::HttpClientFactory> m_httpClientFactory;
  Credentials m_credentials;
};

}  // namespace Client
}  // namespace KW


#endif  // KWCLIENT_CLIENT_CLIENTCONFIGURATION_H_
