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

#include "client/CallEngine.h"

#include <stdint.h>

#include <sstream>
#include <string>

#include "boost/chrono/duration.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/thread.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/RetryStrategy.h"

namespace KW {

namespace Client {

using boost::property_tree::ptree;
using boost::shared_ptr;
using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
CallEngine::CallEngine(const shared_ptr<AuthSession> &session)
    : m_session(session) {
  if (!m_session) {
    throw KW::Exception::ConfigurationException("Session is not set");
  }
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CallEngine::Execute(
    const APIRequest &apiRequest, Http::HttpResponse *response) const {
  const ClientConfiguration &config = m_session->GetConfiguration();

  Http::HttpRequest request;
  ClientError<KWError::Value> err = m_session->NewRequest(
      apiRequest.method, apiRequest.path, apiRequest.apiVersion, &request);
  if (!IsGoodKWError(err)) {
    return err;
  }
  err = apiRequest.params.Encode(&request);
  if (!IsGoodKWError(err)) {
    return err;
  }
  if (apiRequest.body) {
    if (apiRequest.params.HasBody()) {
      return MakeKWError(KWError::PARAMETER,
                         "Request has both a body and body parameters");
    }
    request.body = apiRequest.body;
    request.SetHeader("Content-Type", apiRequest.body->GetContentType());
  }
  m_session->TraceRequest(request, apiRequest.params);

  RetryStrategy retryStrategy(config.GetRetries(),
                              config.GetRetryBackoffUnit());
  for (uint16_t attempt = 0;; ++attempt) {
    if (request.body && !request.body->Rewind()) {
      return MakeKWError(KWError::IO, "Unable to rewind request body of " +
                                          apiRequest.path);
    }

    Http::HttpResponse resp;
    err = m_session->NewClient(apiRequest.streaming)->Send(request, &resp);
    if (IsGoodKWError(err)) {
      m_session->TraceResponse(resp);
      if (Http::IsSuccessStatus(resp.statusCode)) {
        *response = resp;
        return err;
      }
      err = GetKWErrorForResponse(resp, config.GetHost());
    }

    if (!retryStrategy.ShouldRetry(err, attempt)) {
      break;
    }
    DebugWarning("(CALL ERROR) " << m_session->GetUsername() << " -> "
                                 << apiRequest.path << ": "
                                 << GetMessageForKWError(err) << " ("
                                 << attempt + 1 << "/"
                                 << retryStrategy.GetMaxRetryTimes() + 1
                                 << ")");
    if (retryStrategy.ShouldReauthenticate(err)) {
      ClientError<KWError::Value> authErr =
          m_session->Reauthenticate(&request, err);
      if (!IsGoodKWError(authErr)) {
        return authErr;
      }
    }
    boost::this_thread::sleep_for(boost::chrono::milliseconds(
        retryStrategy.CalculateDelayBeforeNextRetry(attempt + 1)));
  }
  return err;
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CallEngine::Call(
    const APIRequest &request) const {
  Http::HttpResponse response;
  return Execute(request, &response);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> CallEngine::ParseBody(const string &body,
                                                  ptree *tree) const {
  try {
    std::istringstream in(body);
    boost::property_tree::read_json(in, *tree);
  } catch (const boost::property_tree::json_parser_error &ex) {
    return MakeKWError(
        KWError::DECODE,
        "I cannot understand what " +
            m_session->GetConfiguration().GetHost() +
            " is saying. (enable verbose tracing): " + ex.what());
  }
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
