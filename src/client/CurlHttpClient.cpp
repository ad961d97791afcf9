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

#include "client/CurlHttpClient.h"

#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <map>
#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/once.hpp"
#include "curl/curl.h"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace KW {

namespace Client {

namespace Http {

using boost::shared_ptr;
using std::map;
using std::string;

namespace {

boost::once_flag curlInitOnce = BOOST_ONCE_INIT;

void InitializeCurl() { curl_global_init(CURL_GLOBAL_DEFAULT); }

// Paused transfer resumes once buffered data drops below this
const size_t STREAM_BUFFER_HIGH_WATER = 1024 * 1024;
const long STREAM_WAIT_MS = 1000;  // NOLINT

struct HeaderCollector {
  HeaderCollector() : statusCode(0), complete(false) {}

  long statusCode;  // NOLINT
  map<string, string> headers;
  bool complete;  // final response headers all arrived
};

struct BodyContext {
  RequestBody *body;
  bool failed;
};

// --------------------------------------------------------------------------
size_t OnHeader(char *buffer, size_t size, size_t nitems, void *userdata) {
  HeaderCollector *collector = static_cast<HeaderCollector *>(userdata);
  size_t len = size * nitems;
  string line = KW::StringUtils::RTrim(
      KW::StringUtils::RTrim(string(buffer, len), '\n'), '\r');

  if (line.compare(0, 5, "HTTP/") == 0) {
    // a new response begins, e.g. after "100 Continue"
    collector->headers.clear();
    collector->complete = false;
    long code = 0;  // NOLINT
    if (sscanf(line.c_str(), "%*s %ld", &code) == 1) {
      collector->statusCode = code;
    }
  } else if (line.empty()) {
    if (collector->statusCode >= 200) {
      collector->complete = true;
    }
  } else {
    string::size_type colon = line.find(':');
    if (colon != string::npos) {
      string name = KW::StringUtils::ToLower(
          KW::StringUtils::Trim(line.substr(0, colon), ' '));
      collector->headers[name] =
          KW::StringUtils::Trim(line.substr(colon + 1), ' ');
    }
  }
  return len;
}

// --------------------------------------------------------------------------
size_t OnBodyData(char *ptr, size_t size, size_t nmemb, void *userdata) {
  string *body = static_cast<string *>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

// --------------------------------------------------------------------------
size_t OnReadBody(char *buffer, size_t size, size_t nitems, void *userdata) {
  BodyContext *ctx = static_cast<BodyContext *>(userdata);
  size_t bytesRead = 0;
  if (!ctx->body->Read(buffer, size * nitems, &bytesRead)) {
    ctx->failed = true;
    return CURL_READFUNC_ABORT;
  }
  return bytesRead;
}

// --------------------------------------------------------------------------
curl_slist *AppendHeader(curl_slist *list, const string &name,
                         const string &value) {
  string line = name + ": " + value;
  if (value.empty()) {
    line = name + ":";  // disables a header curl would add itself
  }
  return curl_slist_append(list, line.c_str());
}

// Caller owns the returned handle and header list
CURL *SetupEasyHandle(const HttpRequest &request,
                      const TransportOptions &options, BodyContext *bodyCtx,
                      curl_slist **headerList) {
  CURL *curl = curl_easy_init();
  if (curl == NULL) {
    return NULL;
  }

  string url = request.GetURL();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifySSL ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifySSL ? 2L : 0L);
  if (!options.proxy.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy.c_str());
  }
  if (options.connectTimeout > 0) {
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout));  // NOLINT
  }
  if (options.requestTimeout > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(options.requestTimeout));  // NOLINT
  }
  if (options.readTimeout > 0) {
    // abort when less than one byte per second for the whole period
    long seconds = std::max(1L, static_cast<long>(  // NOLINT
                                    options.readTimeout / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, seconds);
  }

  curl_slist *list = NULL;
  for (map<string, string>::const_iterator it = request.headers.begin();
       it != request.headers.end(); ++it) {
    list = AppendHeader(list, it->first, it->second);
  }

  if (request.method == HttpMethod::Get) {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else {
    if (request.method != HttpMethod::Post) {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST,
                       HttpMethodToString(request.method).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    if (request.body) {
      curl_easy_setopt(curl, CURLOPT_READFUNCTION, OnReadBody);
      curl_easy_setopt(curl, CURLOPT_READDATA, bodyCtx);
      int64_t len = request.body->GetContentLength();
      if (len >= 0) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(len));
      } else {
        list = AppendHeader(list, "Transfer-Encoding", "chunked");
      }
      if (!request.HasHeader("Content-Type")) {
        list = AppendHeader(list, "Content-Type",
                            request.body->GetContentType());
      }
      list = AppendHeader(list, "Expect", "");
    } else {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
    }
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
  *headerList = list;
  return curl;
}

// --------------------------------------------------------------------------
string DescribeRequest(const HttpRequest &request) {
  return HttpMethodToString(request.method) + " " + request.GetURL();
}

//
// Response body pulled through a curl multi handle. Data delivered by curl
// is kept in a buffer until read, the transfer is paused while the buffer
// is full.
//
class CurlResponseStream : public ResponseStream {
 public:
  explicit CurlResponseStream(const TransportOptions &options)
      : m_options(options),
        m_multi(NULL),
        m_easy(NULL),
        m_headerList(NULL),
        m_bodyCtx(),
        m_bufferPos(0),
        m_done(false),
        m_paused(false),
        m_result(CURLE_OK) {}

  ~CurlResponseStream() { Close(); }

 public:
  ClientError<KWError::Value> Start(const HttpRequest &request);

  long GetStatusCode() const { return m_collector.statusCode; }  // NOLINT
  string GetHeader(const string &name) const {
    map<string, string>::const_iterator it =
        m_collector.headers.find(KW::StringUtils::ToLower(name));
    return it == m_collector.headers.end() ? string() : it->second;
  }

  ClientError<KWError::Value> Read(char *buf, size_t len, size_t *bytesRead);
  void Close();

 private:
  ClientError<KWError::Value> Pump();
  size_t Buffered() const { return m_buffer.size() - m_bufferPos; }
  static size_t OnStreamData(char *ptr, size_t size, size_t nmemb,
                             void *userdata);

 private:
  TransportOptions m_options;
  CURLM *m_multi;
  CURL *m_easy;
  curl_slist *m_headerList;
  shared_ptr<RequestBody> m_body;
  BodyContext m_bodyCtx;
  HeaderCollector m_collector;
  string m_description;
  string m_buffer;
  size_t m_bufferPos;
  bool m_done;
  bool m_paused;
  CURLcode m_result;
};

// --------------------------------------------------------------------------
ClientError<KWError::Value> CurlResponseStream::Start(
    const HttpRequest &request) {
  m_description = DescribeRequest(request);
  m_body = request.body;
  m_bodyCtx.body = m_body.get();
  m_bodyCtx.failed = false;
  m_easy = SetupEasyHandle(request, m_options, &m_bodyCtx, &m_headerList);
  m_multi = curl_multi_init();
  if (m_easy == NULL || m_multi == NULL) {
    return MakeKWError(KWError::TRANSPORT,
                       m_description + ": unable to initialize curl");
  }
  curl_easy_setopt(m_easy, CURLOPT_HEADERFUNCTION, OnHeader);
  curl_easy_setopt(m_easy, CURLOPT_HEADERDATA, &m_collector);
  curl_easy_setopt(m_easy, CURLOPT_WRITEFUNCTION, OnStreamData);
  curl_easy_setopt(m_easy, CURLOPT_WRITEDATA, this);
  curl_multi_add_handle(m_multi, m_easy);

  while (!m_collector.complete && !m_done) {
    ClientError<KWError::Value> err = Pump();
    if (!IsGoodKWError(err)) {
      return err;
    }
  }
  if (m_done && m_result != CURLE_OK && !m_collector.complete) {
    if (m_bodyCtx.failed) {
      return MakeKWError(KWError::IO,
                         m_description + ": unable to read request body");
    }
    return MakeKWError(KWError::TRANSPORT,
                       m_description + ": " + curl_easy_strerror(m_result));
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CurlResponseStream::Read(char *buf, size_t len,
                                                     size_t *bytesRead) {
  *bytesRead = 0;
  while (Buffered() == 0 && !m_done && m_multi != NULL) {
    ClientError<KWError::Value> err = Pump();
    if (!IsGoodKWError(err)) {
      return err;
    }
  }

  if (Buffered() == 0) {
    if (m_done && m_result != CURLE_OK) {
      return MakeKWError(KWError::TRANSPORT,
                         m_description + ": " + curl_easy_strerror(m_result));
    }
    return ClientError<KWError::Value>();  // end of body
  }

  size_t n = std::min(len, Buffered());
  memcpy(buf, m_buffer.data() + m_bufferPos, n);
  m_bufferPos += n;
  *bytesRead = n;

  if (m_bufferPos == m_buffer.size()) {
    m_buffer.clear();
    m_bufferPos = 0;
  } else if (m_bufferPos > m_buffer.size() / 2) {
    m_buffer.erase(0, m_bufferPos);
    m_bufferPos = 0;
  }

  if (m_paused && Buffered() < STREAM_BUFFER_HIGH_WATER) {
    m_paused = false;
    curl_easy_pause(m_easy, CURLPAUSE_CONT);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
void CurlResponseStream::Close() {
  if (m_multi != NULL && m_easy != NULL) {
    curl_multi_remove_handle(m_multi, m_easy);
  }
  if (m_easy != NULL) {
    curl_easy_cleanup(m_easy);
    m_easy = NULL;
  }
  if (m_multi != NULL) {
    curl_multi_cleanup(m_multi);
    m_multi = NULL;
  }
  if (m_headerList != NULL) {
    curl_slist_free_all(m_headerList);
    m_headerList = NULL;
  }
  m_buffer.clear();
  m_bufferPos = 0;
  m_done = true;
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CurlResponseStream::Pump() {
  int running = 0;
  CURLMcode mc = curl_multi_perform(m_multi, &running);
  if (mc != CURLM_OK) {
    m_done = true;
    return MakeKWError(KWError::TRANSPORT,
                       m_description + ": " + curl_multi_strerror(mc));
  }

  int left = 0;
  CURLMsg *msg = NULL;
  while ((msg = curl_multi_info_read(m_multi, &left)) != NULL) {
    if (msg->msg == CURLMSG_DONE) {
      m_done = true;
      m_result = msg->data.result;
    }
  }

  if (!m_done && Buffered() == 0 && !m_paused) {
    int numfds = 0;
    curl_multi_wait(m_multi, NULL, 0, STREAM_WAIT_MS, &numfds);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
size_t CurlResponseStream::OnStreamData(char *ptr, size_t size, size_t nmemb,
                                        void *userdata) {
  CurlResponseStream *stream = static_cast<CurlResponseStream *>(userdata);
  if (stream->Buffered() >= STREAM_BUFFER_HIGH_WATER) {
    stream->m_paused = true;
    return CURL_WRITEFUNC_PAUSE;
  }
  stream->m_buffer.append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

// --------------------------------------------------------------------------
CurlHttpClient::CurlHttpClient(const TransportOptions &options)
    : m_options(options) {
  boost::call_once(curlInitOnce, InitializeCurl);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CurlHttpClient::Send(const HttpRequest &request,
                                                 HttpResponse *response) {
  BodyContext bodyCtx = {request.body.get(), false};
  curl_slist *headerList = NULL;
  CURL *curl = SetupEasyHandle(request, m_options, &bodyCtx, &headerList);
  if (curl == NULL) {
    return MakeKWError(KWError::TRANSPORT,
                       DescribeRequest(request) + ": curl_easy_init failed");
  }

  HeaderCollector collector;
  string body;
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, OnHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &collector);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, OnBodyData);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

  CURLcode rc = curl_easy_perform(curl);
  long status = 0;  // NOLINT
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headerList);
  curl_easy_cleanup(curl);
  DebugInfo(DescribeRequest(request) << " completed with status " << status);

  if (bodyCtx.failed) {
    return MakeKWError(KWError::IO, DescribeRequest(request) +
                                        ": unable to read request body");
  }
  if (rc != CURLE_OK) {
    return MakeKWError(KWError::TRANSPORT,
                       DescribeRequest(request) + ": " +
                           curl_easy_strerror(rc));
  }

  response->statusCode = status;
  response->headers.swap(collector.headers);
  response->body.swap(body);
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CurlHttpClient::Open(
    const HttpRequest &request, shared_ptr<ResponseStream> *stream) {
  shared_ptr<CurlResponseStream> curlStream =
      boost::make_shared<CurlResponseStream>(m_options);
  ClientError<KWError::Value> err = curlStream->Start(request);
  if (!IsGoodKWError(err)) {
    curlStream->Close();
    return err;
  }
  *stream = curlStream;
  return err;
}

// --------------------------------------------------------------------------
shared_ptr<HttpClient> CurlHttpClientFactory::MakeClient(
    const TransportOptions &options) {
  return boost::make_shared<CurlHttpClient>(options);
}

}  // namespace Http
}  // namespace Client
}  // namespace KW
