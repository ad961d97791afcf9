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

#ifndef KWCLIENT_TEST_FAKEHTTPCLIENT_H_
#define KWCLIENT_TEST_FAKEHTTPCLIENT_H_

#include <stddef.h>
#include <string.h>

#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/StringUtils.h"
#include "client/Http.h"
#include "client/HttpClient.h"
#include "client/KWError.h"

namespace KW {

namespace Client {

namespace Http {

// A reply handed out for one request
struct ScriptedReply {
  ScriptedReply() {}

  ClientError<KWError::Value> error;  // transport error if not GOOD
  HttpResponse response;
};

// A request as seen on the wire
struct SentRequest {
  HttpRequest request;
  std::string body;  // drained request body
  TransportOptions options;
};

class FakeHttpClientFactory;

class FakeResponseStream : public ResponseStream {
 public:
  explicit FakeResponseStream(const HttpResponse &response)
      : m_response(response), m_pos(0), m_closed(false) {}

  long GetStatusCode() const { return m_response.statusCode; }  // NOLINT
  std::string GetHeader(const std::string &name) const {
    return m_response.GetHeader(name);
  }
  ClientError<KWError::Value> Read(char *buf, size_t len, size_t *bytesRead) {
    *bytesRead = 0;
    if (m_closed) {
      return ClientError<KWError::Value>();
    }
    size_t n = std::min(len, m_response.body.size() - m_pos);
    memcpy(buf, m_response.body.data() + m_pos, n);
    m_pos += n;
    *bytesRead = n;
    return ClientError<KWError::Value>();
  }
  void Close() { m_closed = true; }

 private:
  HttpResponse m_response;
  size_t m_pos;
  bool m_closed;
};

class FakeHttpClient : public HttpClient {
 public:
  FakeHttpClient(FakeHttpClientFactory *factory,
                 const TransportOptions &options)
      : m_factory(factory), m_options(options) {}

  ClientError<KWError::Value> Send(const HttpRequest &request,
                                   HttpResponse *response);
  ClientError<KWError::Value> Open(const HttpRequest &request,
                                   boost::shared_ptr<ResponseStream> *stream);

 private:
  FakeHttpClientFactory *m_factory;
  TransportOptions m_options;
};

// Hands out scripted replies in order and keeps every request. A request
// without a scripted reply fails with a transport error.
class FakeHttpClientFactory : public HttpClientFactory {
 public:
  boost::shared_ptr<HttpClient> MakeClient(const TransportOptions &options) {
    return boost::make_shared<FakeHttpClient>(this, options);
  }

  void PushReply(long status, const std::string &body) {  // NOLINT
    ScriptedReply reply;
    reply.response.statusCode = status;
    reply.response.body = body;
    m_replies.push_back(reply);
  }

  void PushReply(long status, const std::string &body,  // NOLINT
                 const std::string &header, const std::string &value) {
    PushReply(status, body);
    m_replies.back().response.headers[KW::StringUtils::ToLower(header)] =
        value;
  }

  void PushTransportError(const std::string &message) {
    ScriptedReply reply;
    reply.error = MakeKWError(KWError::TRANSPORT, message);
    m_replies.push_back(reply);
  }

  ClientError<KWError::Value> Dispatch(const HttpRequest &request,
                                       const TransportOptions &options,
                                       HttpResponse *response) {
    SentRequest sent;
    sent.request = request;
    sent.options = options;
    if (request.body) {
      char buf[1024];
      size_t n = 0;
      while (request.body->Read(buf, sizeof(buf), &n) && n > 0) {
        sent.body.append(buf, n);
      }
    }
    m_sent.push_back(sent);

    if (m_replies.empty()) {
      return MakeKWError(KWError::TRANSPORT, "No scripted reply");
    }
    ScriptedReply reply = m_replies.front();
    m_replies.pop_front();
    *response = reply.response;
    return reply.error;
  }

  const std::vector<SentRequest> &GetSentRequests() const { return m_sent; }
  size_t GetPendingReplies() const { return m_replies.size(); }

 private:
  std::deque<ScriptedReply> m_replies;
  std::vector<SentRequest> m_sent;
};

inline ClientError<KWError::Value> FakeHttpClient::Send(
    const HttpRequest &request, HttpResponse *response) {
  return m_factory->Dispatch(request, m_options, response);
}

inline ClientError<KWError::Value> FakeHttpClient::Open(
    const HttpRequest &request, boost::shared_ptr<ResponseStream> *stream) {
  HttpResponse response;
  ClientError<KWError::Value> err =
      m_factory->Dispatch(request, m_options, &response);
  if (IsGoodKWError(err)) {
    *stream = boost::make_shared<FakeResponseStream>(response);
  }
  return err;
}

}  // namespace Http
}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_TEST_FAKEHTTPCLIENT_H_
