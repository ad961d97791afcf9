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

#ifndef KWCLIENT_CLIENT_CURLHTTPCLIENT_H_
#define KWCLIENT_CLIENT_CURLHTTPCLIENT_H_

#include "boost/shared_ptr.hpp"

#include "client/Http.h"
#include "client/HttpClient.h"
#include "client/KWError.h"

namespace KW {

namespace Client {

namespace Http {

// HttpClient over libcurl easy and multi handles
class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(const TransportOptions &options);
  ~CurlHttpClient() {}

  ClientError<KWError::Value> Send(const HttpRequest &request,
                                   HttpResponse *response);

  ClientError<KWError::Value> Open(const HttpRequest &request,
                                   boost::shared_ptr<ResponseStream> *stream);

  const TransportOptions &GetOptions() const { return m_options; }

 private:
  TransportOptions m_options;
};

class CurlHttpClientFactory : public HttpClientFactory {
 public:
  boost::shared_ptr<HttpClient> MakeClient(const TransportOptions &options);
};

}  // namespace Http
}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_CURLHTTPCLIENT_H_
