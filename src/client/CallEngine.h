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

#ifndef KWCLIENT_CLIENT_CALLENGINE_H_
#define KWCLIENT_CLIENT_CALLENGINE_H_

#include <sstream>
#include <string>

#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"
#include "boost/shared_ptr.hpp"

#include "client/AuthSession.h"
#include "client/Http.h"
#include "client/KWError.h"
#include "client/RequestParams.h"
#include "client/Types.h"

namespace KW {

namespace Client {

struct APIRequest {
  APIRequest()
      : method(Http::HttpMethod::Get), apiVersion(0), streaming(false) {}
  APIRequest(Http::HttpMethod::Value method_, const std::string &path_,
             int apiVersion_ = 0)
      : method(method_),
        path(path_),
        apiVersion(apiVersion_),
        streaming(false) {}

  Http::HttpMethod::Value method;
  std::string path;  // begins with '/'
  int apiVersion;    // 0 for default
  RequestParams params;
  boost::shared_ptr<Http::RequestBody> body;  // raw body, excludes body params
  bool streaming;  // no overall deadline, see ClientConfiguration
};

// --------------------------------------------------------------------------
//
// CallEngine
//
// Executes api calls of a session with retry. Errors carrying internal
// server or token categories get a reauthentication and a backoff of
// (attempt)^2 units before the next attempt, transport errors only the
// backoff. Anything else ends the call.
//
class CallEngine {
 public:
  explicit CallEngine(const boost::shared_ptr<AuthSession> &session);

 public:
  // Execute call and keep the 2xx response
  //
  // @param  : request, output response
  // @return : error of last attempt
  //
  // May throw ConfigurationException when reauthentication is impossible.
  ClientError<KWError::Value> Execute(const APIRequest &request,
                                      Http::HttpResponse *response) const;

  // Execute call and decode json body into result
  //
  // @param  : request, output result
  // @return : error
  //
  // An empty body leaves result untouched. Result type needs a Decode
  // overload, see client/Types.h.
  template <typename Result>
  ClientError<KWError::Value> Call(const APIRequest &request,
                                   Result *result) const {
    Http::HttpResponse response;
    ClientError<KWError::Value> err = Execute(request, &response);
    if (!IsGoodKWError(err) || response.body.empty() || result == NULL) {
      return err;
    }
    boost::property_tree::ptree tree;
    err = ParseBody(response.body, &tree);
    if (!IsGoodKWError(err)) {
      return err;
    }
    return Decode(tree, result);
  }

  // Execute call and drop response body
  ClientError<KWError::Value> Call(const APIRequest &request) const;

  const boost::shared_ptr<AuthSession> &GetSession() const {
    return m_session;
  }

 private:
  ClientError<KWError::Value> ParseBody(
      const std::string &body, boost::property_tree::ptree *tree) const;

 private:
  boost::shared_ptr<AuthSession> m_session;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_CALLENGINE_H_
