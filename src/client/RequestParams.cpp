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

#include "client/RequestParams.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/variant/apply_visitor.hpp"
#include "boost/variant/static_visitor.hpp"

#include "nlohmann/json.hpp"

#include "base/StringUtils.h"
#include "client/Constants.h"
#include "client/Utils.h"

namespace KW {

namespace Client {

using boost::to_string;
using nlohmann::ordered_json;
using std::string;
using std::vector;

namespace {

struct StringValueVisitor : public boost::static_visitor<string> {
  string operator()(const string &value) const { return value; }
  string operator()(int64_t value) const { return to_string(value); }
  string operator()(bool value) const { return value ? "true" : "false"; }
  string operator()(const vector<string> &values) const {
    return KW::StringUtils::Join(values, ",");
  }
  string operator()(const vector<int64_t> &values) const {
    vector<string> strs;
    for (size_t i = 0; i < values.size(); ++i) {
      strs.push_back(to_string(values[i]));
    }
    return KW::StringUtils::Join(strs, ",");
  }
};

struct JSONValueVisitor : public boost::static_visitor<ordered_json> {
  template <typename T>
  ordered_json operator()(const T &value) const {
    return ordered_json(value);
  }
};

string DescribeEntries(const ParamEntries &entries) {
  vector<string> pairs;
  for (ParamEntries::const_iterator it = entries.begin(); it != entries.end();
       ++it) {
    string value = Utils::IsSecretField(it->first)
                       ? string(Constants::RedactedValue)
                       : ParamValueToString(it->second);
    pairs.push_back(it->first + "=" + value);
  }
  return KW::StringUtils::Join(pairs, ", ");
}

struct IsBodyVisitor : public boost::static_visitor<bool> {
  bool operator()(const Query &) const { return false; }
  bool operator()(const PostForm &) const { return true; }
  bool operator()(const PostJSON &) const { return true; }
};

struct EncodeVisitor
    : public boost::static_visitor<ClientError<KWError::Value> > {
  explicit EncodeVisitor(Http::HttpRequest *req) : request(req) {}

  ClientError<KWError::Value> operator()(const Query &query) const {
    const ParamEntries &entries = query.GetEntries();
    for (ParamEntries::const_iterator it = entries.begin();
         it != entries.end(); ++it) {
      request->AddQuery(it->first, ParamValueToString(it->second));
    }
    return ClientError<KWError::Value>();
  }

  ClientError<KWError::Value> operator()(const PostForm &form) const {
    Http::QueryList pairs;
    const ParamEntries &entries = form.GetEntries();
    for (ParamEntries::const_iterator it = entries.begin();
         it != entries.end(); ++it) {
      pairs.push_back(std::make_pair(it->first, ParamValueToString(it->second)));
    }
    request->body = boost::make_shared<Http::StringBody>(
        Http::BuildQueryString(pairs), Constants::ContentTypeForm);
    request->SetHeader("Content-Type", Constants::ContentTypeForm);
    return ClientError<KWError::Value>();
  }

  ClientError<KWError::Value> operator()(const PostJSON &json) const {
    string content;
    ClientError<KWError::Value> err =
        ParamEntriesToJSON(json.GetEntries(), &content);
    if (!IsGoodKWError(err)) {
      return err;
    }
    request->body = boost::make_shared<Http::StringBody>(
        content, Constants::ContentTypeJSON);
    request->SetHeader("Content-Type", Constants::ContentTypeJSON);
    return ClientError<KWError::Value>();
  }

  Http::HttpRequest *request;
};

struct DescribeVisitor : public boost::static_visitor<string> {
  string operator()(const Query &query) const {
    return "Query: " + DescribeEntries(query.GetEntries());
  }
  string operator()(const PostForm &form) const {
    return "PostForm: " + DescribeEntries(form.GetEntries());
  }
  string operator()(const PostJSON &json) const {
    return "PostJSON: " + DescribeEntries(json.GetEntries());
  }
};

}  // namespace

// --------------------------------------------------------------------------
string ParamValueToString(const ParamValue &value) {
  return boost::apply_visitor(StringValueVisitor(), value);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ParamEntriesToJSON(const ParamEntries &entries,
                                               string *json) {
  ordered_json object = ordered_json::object();
  for (ParamEntries::const_iterator it = entries.begin(); it != entries.end();
       ++it) {
    object[it->first] = boost::apply_visitor(JSONValueVisitor(), it->second);
  }
  try {
    *json = object.dump();
  } catch (const nlohmann::json::exception &err) {
    return MakeKWError(KWError::PARAMETER,
                       string("Unable to encode json body: ") + err.what());
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
RequestParams &RequestParams::Add(const RequestParam &param) {
  if (boost::apply_visitor(IsBodyVisitor(), param) && HasBody()) {
    m_validationError =
        "Only one of PostForm or PostJSON can be set for a request";
  }
  m_params.push_back(param);
  return *this;
}

// --------------------------------------------------------------------------
bool RequestParams::HasBody() const {
  for (vector<RequestParam>::const_iterator it = m_params.begin();
       it != m_params.end(); ++it) {
    if (boost::apply_visitor(IsBodyVisitor(), *it)) {
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> RequestParams::Encode(
    Http::HttpRequest *request) const {
  if (!IsValid()) {
    return MakeKWError(KWError::PARAMETER, m_validationError);
  }
  if (HasBody() && request->body) {
    return MakeKWError(KWError::PARAMETER,
                       "Request already carries a body, no room for " +
                           Describe());
  }
  EncodeVisitor visitor(request);
  for (vector<RequestParam>::const_iterator it = m_params.begin();
       it != m_params.end(); ++it) {
    ClientError<KWError::Value> err = boost::apply_visitor(visitor, *it);
    if (!IsGoodKWError(err)) {
      return err;
    }
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
string RequestParams::Describe() const {
  vector<string> lines;
  for (vector<RequestParam>::const_iterator it = m_params.begin();
       it != m_params.end(); ++it) {
    lines.push_back(boost::apply_visitor(DescribeVisitor(), *it));
  }
  return KW::StringUtils::Join(lines, "\n");
}

}  // namespace Client
}  // namespace KW
