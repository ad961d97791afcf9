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

#ifndef KWCLIENT_CLIENT_HTTP_H_
#define KWCLIENT_CLIENT_HTTP_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

namespace KW {

namespace Client {

namespace Http {

struct HttpMethod {
  enum Value { Get, Post, Put, Delete };
};

std::string HttpMethodToString(HttpMethod::Value method);

// 2xx
bool IsSuccessStatus(long statusCode);  // NOLINT

// Percent encode a query component as in application/x-www-form-urlencoded
std::string UrlEncode(const std::string &str);

typedef std::vector<std::pair<std::string, std::string> > QueryList;

// Build "k1=v1&k2=v2" with every key and value encoded
std::string BuildQueryString(const QueryList &query);

//
// RequestBody
//
// Source of an outgoing request body which is pulled by the transport.
// Rewind stages the body again from its first byte so a request can be
// resent.
//
class RequestBody : private boost::noncopyable {
 public:
  virtual ~RequestBody() {}

  // @param  : buffer, buffer length
  // @param  : output count of bytes written into buffer, 0 means the end
  // @return : false on source failure
  virtual bool Read(char *buf, size_t len, size_t *bytesRead) = 0;

  virtual bool Rewind() = 0;

  // -1 if unknown, the transport then uses chunked transfer encoding
  virtual int64_t GetContentLength() const = 0;
  virtual const std::string &GetContentType() const = 0;
};

class StringBody : public RequestBody {
 public:
  StringBody(const std::string &content, const std::string &contentType)
      : m_content(content), m_contentType(contentType), m_pos(0) {}

  bool Read(char *buf, size_t len, size_t *bytesRead);
  bool Rewind() {
    m_pos = 0;
    return true;
  }
  int64_t GetContentLength() const {
    return static_cast<int64_t>(m_content.size());
  }
  const std::string &GetContentType() const { return m_contentType; }
  const std::string &GetContent() const { return m_content; }

 private:
  std::string m_content;
  std::string m_contentType;
  size_t m_pos;
};

struct HttpRequest {
  HttpRequest() : method(HttpMethod::Get) {}

  // Full url, e.g. "https://host/rest/files/1?k=v"
  std::string GetURL() const;
  void SetHeader(const std::string &name, const std::string &value);
  std::string GetHeader(const std::string &name) const;
  bool HasHeader(const std::string &name) const;
  void AddQuery(const std::string &key, const std::string &value);

  HttpMethod::Value method;
  std::string host;
  std::string path;  // begins with '/'
  QueryList query;
  std::map<std::string, std::string> headers;
  boost::shared_ptr<RequestBody> body;
};

struct HttpResponse {
  HttpResponse() : statusCode(0) {}

  // lookup is case insensitive
  std::string GetHeader(const std::string &name) const;

  long statusCode;  // NOLINT
  std::map<std::string, std::string> headers;  // lower case names
  std::string body;
};

}  // namespace Http
}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_HTTP_H_
