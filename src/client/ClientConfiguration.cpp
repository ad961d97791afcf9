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

#include "client/ClientConfiguration.h"

#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "client/CurlHttpClient.h"
#include "client/TokenStore.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

using boost::shared_ptr;
using KW::Configure::Default::GetDefaultAgentString;
using KW::Configure::Default::GetDefaultConnectTimeout;
using KW::Configure::Default::GetDefaultRequestTimeout;
using KW::Configure::Default::GetDefaultRetries;
using KW::Configure::Default::GetRetryBackoffUnit;
using std::string;

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration(const string &host)
    : m_host(host),
      m_agentString(GetDefaultAgentString()),
      m_verifySSL(true),
      m_trace(false),
      m_requestTimeout(GetDefaultRequestTimeout()),
      m_connectTimeout(GetDefaultConnectTimeout()),
      m_maxChunkSize(0),
      m_retries(GetDefaultRetries()),
      m_retryBackoffUnit(GetRetryBackoffUnit()),
      m_tokenStore(boost::make_shared<MemoryTokenStore>()),
      m_httpClientFactory(boost::make_shared<Http::CurlHttpClientFactory>()) {}

// --------------------------------------------------------------------------
Http::TransportOptions ClientConfiguration::GetTransportOptions(
    bool streaming) const {
  Http::TransportOptions options;
  options.verifySSL = m_verifySSL;
  options.proxy = m_proxyURI;
  options.connectTimeout = m_connectTimeout;
  if (streaming) {
    options.requestTimeout = 0;
    options.readTimeout = m_requestTimeout;
  } else {
    options.requestTimeout = m_requestTimeout;
    options.readTimeout = 0;
  }
  return options;
}

// --------------------------------------------------------------------------
void ClientConfiguration::SetTokenStore(const shared_ptr<TokenStore> &store) {
  m_tokenStore = store;
}

// --------------------------------------------------------------------------
void ClientConfiguration::SetHttpClientFactory(
    const shared_ptr<Http::HttpClientFactory> &factory) {
  m_httpClientFactory = factory;
}

}  // namespace Client
}  // namespace KW
