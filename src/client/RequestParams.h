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

#ifndef KWCLIENT_CLIENT_REQUESTPARAMS_H_
#define KWCLIENT_CLIENT_REQUESTPARAMS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "boost/variant.hpp"

#include "client/Http.h"
#include "client/KWError.h"

namespace KW {

namespace Client {

typedef boost::variant<std::string, int64_t, bool, std::vector<std::string>,
                       std::vector<int64_t> >
    ParamValue;

typedef std::vector<std::pair<std::string, ParamValue> > ParamEntries;

// Ordered key value pairs. Setting an existing key replaces its value.
template <typename Derived>
class ParamSet {
 public:
  Derived &Set(const std::string &key, const std::string &value) {
    return Put(key, ParamValue(value));
  }
  Derived &Set(const std::string &key, const char *value) {
    return Put(key, ParamValue(std::string(value)));
  }
  Derived &Set(const std::string &key, int64_t value) {
    return Put(key, ParamValue(value));
  }
  Derived &Set(const std::string &key, int value) {
    return Put(key, ParamValue(static_cast<int64_t>(value)));
  }
  Derived &Set(const std::string &key, bool value) {
    return Put(key, ParamValue(value));
  }
  Derived &Set(const std::string &key, const std::vector<std::string> &value) {
    return Put(key, ParamValue(value));
  }
  Derived &Set(const std::string &key, const std::vector<int64_t> &value) {
    return Put(key, ParamValue(value));
  }

  const ParamEntries &GetEntries() const { return m_entries; }
  bool IsEmpty() const { return m_entries.empty(); }

 private:
  Derived &Put(const std::string &key, const ParamValue &value) {
    for (ParamEntries::iterator it = m_entries.begin(); it != m_entries.end();
         ++it) {
      if (it->first == key) {
        it->second = value;
        return static_cast<Derived &>(*this);
      }
    }
    m_entries.push_back(std::make_pair(key, value));
    return static_cast<Derived &>(*this);
  }

  ParamEntries m_entries;
};

// Merged into the url query string
struct Query : public ParamSet<Query> {};
// Body in application/x-www-form-urlencoded, lists are joined by ','
struct PostForm : public ParamSet<PostForm> {};
// Body in application/json
struct PostJSON : public ParamSet<PostJSON> {};

typedef boost::variant<Query, PostForm, PostJSON> RequestParam;

// Render a value the way it appears in a query or form, e.g. "1,2,3"
std::string ParamValueToString(const ParamValue &value);

// Render entries as a json object, keys in insertion order.
// Fails with PARAMETER when a string is not valid UTF-8.
ClientError<KWError::Value> ParamEntriesToJSON(const ParamEntries &entries,
                                               std::string *json);

//
// RequestParams
//
// Parameters of one call. Any number of Query, at most one body parameter
// of either kind; adding a second body parameter invalidates the set.
//
class RequestParams {
 public:
  RequestParams() {}

 public:
  RequestParams &Add(const RequestParam &param);

  bool IsValid() const { return m_validationError.empty(); }
  const std::string &GetValidationError() const { return m_validationError; }
  const std::vector<RequestParam> &GetParams() const { return m_params; }
  bool HasBody() const;

  // Merge queries into request and set body
  //
  // @param  : request to encode into
  // @return : PARAMETER error if params are invalid
  ClientError<KWError::Value> Encode(Http::HttpRequest *request) const;

  // One line per parameter with secrets masked, for request tracing
  std::string Describe() const;

 private:
  std::vector<RequestParam> m_params;
  std::string m_validationError;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_REQUESTPARAMS_H_
