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

#include "client/Http.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "base/StringUtils.h"

namespace KW {

namespace Client {

namespace Http {

using std::map;
using std::string;
using std::vector;

namespace {

typedef map<string, string>::const_iterator HeaderIterator;

HeaderIterator FindHeader(const map<string, string> &headers,
                          const string &name) {
  string lower = KW::StringUtils::ToLower(name);
  for (HeaderIterator it = headers.begin(); it != headers.end(); ++it) {
    if (KW::StringUtils::ToLower(it->first) == lower) {
      return it;
    }
  }
  return headers.end();
}

}  // namespace

// --------------------------------------------------------------------------
string HttpMethodToString(HttpMethod::Value method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Post:
      return "POST";
    case HttpMethod::Put:
      return "PUT";
    case HttpMethod::Delete:
      return "DELETE";
    default:
      return "GET";
  }
}

// --------------------------------------------------------------------------
bool IsSuccessStatus(long statusCode) {  // NOLINT
  return statusCode >= 200 && statusCode < 300;
}

// --------------------------------------------------------------------------
string UrlEncode(const string &str) {
  static const char *unreserved = "-_.~";
  string encoded;
  encoded.reserve(str.size() * 3);
  for (string::const_iterator it = str.begin(); it != str.end(); ++it) {
    unsigned char ch = static_cast<unsigned char>(*it);
    if (isalnum(ch) || (ch != 0 && strchr(unreserved, ch) != NULL)) {
      encoded.push_back(ch);
    } else if (ch == ' ') {
      encoded.push_back('+');
    } else {
      char hex[4] = "";
      snprintf(hex, sizeof(hex), "%%%02X", ch);
      encoded.append(hex);
    }
  }
  return encoded;
}

// --------------------------------------------------------------------------
string BuildQueryString(const QueryList &query) {
  vector<string> pairs;
  for (QueryList::const_iterator it = query.begin(); it != query.end(); ++it) {
    pairs.push_back(UrlEncode(it->first) + "=" + UrlEncode(it->second));
  }
  return KW::StringUtils::Join(pairs, "&");
}

// --------------------------------------------------------------------------
bool StringBody::Read(char *buf, size_t len, size_t *bytesRead) {
  size_t n = std::min(len, m_content.size() - m_pos);
  if (n > 0) {
    memcpy(buf, m_content.data() + m_pos, n);
    m_pos += n;
  }
  *bytesRead = n;
  return true;
}

// --------------------------------------------------------------------------
string HttpRequest::GetURL() const {
  string url = "https://" + host + path;
  if (!query.empty()) {
    url += (path.find('?') == string::npos ? "?" : "&");
    url += BuildQueryString(query);
  }
  return url;
}

// --------------------------------------------------------------------------
void HttpRequest::SetHeader(const string &name, const string &value) {
  HeaderIterator it = FindHeader(headers, name);
  if (it != headers.end()) {
    string existing = it->first;
    headers.erase(existing);
  }
  headers[name] = value;
}

// --------------------------------------------------------------------------
string HttpRequest::GetHeader(const string &name) const {
  HeaderIterator it = FindHeader(headers, name);
  return it == headers.end() ? string() : it->second;
}

// --------------------------------------------------------------------------
bool HttpRequest::HasHeader(const string &name) const {
  return FindHeader(headers, name) != headers.end();
}

// --------------------------------------------------------------------------
void HttpRequest::AddQuery(const string &key, const string &value) {
  for (QueryList::iterator it = query.begin(); it != query.end(); ++it) {
    if (it->first == key) {
      it->second = value;
      return;
    }
  }
  query.push_back(std::make_pair(key, value));
}

// --------------------------------------------------------------------------
string HttpResponse::GetHeader(const string &name) const {
  HeaderIterator it = FindHeader(headers, name);
  return it == headers.end() ? string() : it->second;
}

}  // namespace Http
}  // namespace Client
}  // namespace KW
