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

#include "client/KWError.h"

#include <string>

#include "boost/exception/to_string.hpp"

namespace KW {

namespace Client {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string KWErrorToString(KWError::Value err) {
  switch (err) {
    case KWError::GOOD:
      return "Good";
    case KWError::TRANSPORT:
      return "TransportError";
    case KWError::VENDOR_API:
      return "VendorAPIError";
    case KWError::UNEXPECTED_RESPONSE:
      return "UnexpectedResponse";
    case KWError::PROTOCOL:
      return "ProtocolError";
    case KWError::DECODE:
      return "DecodeError";
    case KWError::TOKEN_STORE:
      return "TokenStoreError";
    case KWError::NO_AUTH_TOKEN:
      return "NoAuthToken";
    case KWError::PARAMETER:
      return "ParameterError";
    case KWError::IO:
      return "IOError";
    case KWError::UNKNOWN:  // Bypass
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> MakeKWError(KWError::Value err,
                                        const string &message) {
  return ClientError<KWError::Value>(err, KWErrorToString(err), message,
                                     err == KWError::TRANSPORT);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> MakeVendorError(const APIError &apiError) {
  return ClientError<KWError::Value>(
      KWError::VENDOR_API, KWErrorToString(KWError::VENDOR_API), apiError);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> GetKWErrorForResponse(
    const Http::HttpResponse &response, const string &host) {
  APIError apiError;
  if (ParseAPIErrorBody(response.body, &apiError)) {
    return MakeVendorError(apiError);
  }
  if (response.statusCode == 401) {
    apiError.AddError(APIErrorFlag::AUTH_UNAUTHORIZED,
                      "Unauthorized Access Token");
    return MakeVendorError(apiError);
  }
  return MakeKWError(KWError::UNEXPECTED_RESPONSE,
                     host + " says \"" + to_string(response.statusCode) +
                         ".\"");
}

// --------------------------------------------------------------------------
string GetMessageForKWError(const ClientError<KWError::Value> &error) {
  return error.GetExceptionName() + ": " + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodKWError(const ClientError<KWError::Value> &error) {
  return error.GetError() == KWError::GOOD;
}

}  // namespace Client
}  // namespace KW
