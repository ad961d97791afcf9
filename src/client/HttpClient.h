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

#ifndef KWCLIENT_CLIENT_HTTPCLIENT_H_
#define KWCLIENT_CLIENT_HTTPCLIENT_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/Http.h"
#include "client/KWError.h"

namespace KW {

namespace Client {

namespace Http {

struct TransportOptions {
  TransportOptions()
      : verifySSL(true),
        connectTimeout(0),
        requestTimeout(0),
        readTimeout(0) {}

  bool verifySSL;
  std::string proxy;        // empty for direct connection
  uint32_t connectTimeout;  // in milliseconds, 0 for transport default
  uint32_t requestTimeout;  // in milliseconds for whole exchange, 0 for none
  uint32_t readTimeout;     // in milliseconds without any progress, 0 for none
};

//
// ResponseStream
//
// Response whose body is pulled by the caller piece by piece.
// Status and headers are available once the stream is opened.
//
class ResponseStream : private boost::noncopyable {
 public:
  virtual ~ResponseStream() {}

  virtual long GetStatusCode() const = 0;  // NOLINT
  virtual std::string GetHeader(const std::string &name) const = 0;

  // @param  : buffer, buffer length
  // @param  : output count of bytes, 0 at the end of body
  // @return : error
  virtual ClientError<KWError::Value> Read(char *buf, size_t len,
                                           size_t *bytesRead) = 0;

  // Release the connection, further reads report the end of body
  virtual void Close() = 0;
};

//
// HttpClient
//
// One client serves one logical exchange, settings come from the
// TransportOptions it was made with.
//
class HttpClient : private boost::noncopyable {
 public:
  virtual ~HttpClient() {}

  // Send request and buffer the whole response
  //
  // @param  : request, output response
  // @return : error, GOOD if any response is received whatever its status
  virtual ClientError<KWError::Value> Send(const HttpRequest &request,
                                           HttpResponse *response) = 0;

  // Send request and return once response headers arrive
  //
  // @param  : request, output stream
  // @return : error, GOOD if any response is received whatever its status
  virtual ClientError<KWError::Value> Open(
      const HttpRequest &request,
      boost::shared_ptr<ResponseStream> *stream) = 0;
};

class HttpClientFactory : private boost::noncopyable {
 public:
  virtual ~HttpClientFactory() {}

  virtual boost::shared_ptr<HttpClient> MakeClient(
      const TransportOptions &options) = 0;
};

}  // namespace Http
}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_HTTPCLIENT_H_
