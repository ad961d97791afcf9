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

#ifndef KWCLIENT_CLIENT_KWERROR_H_
#define KWCLIENT_CLIENT_KWERROR_H_

#include <string>

#include "client/APIError.h"
#include "client/ClientError.hpp"
#include "client/Http.h"

namespace KW {

namespace Client {

struct KWError {
  enum Value {
    GOOD,
    UNKNOWN,

    TRANSPORT,            // network or tls failure, no response
    VENDOR_API,           // response carries classified error codes
    UNEXPECTED_RESPONSE,  // non 2xx response without error codes
    PROTOCOL,             // response shape breaks the api contract
    DECODE,               // response body cannot be decoded

    TOKEN_STORE,    // token store failure
    NO_AUTH_TOKEN,  // no usable access token for user
    PARAMETER,      // request cannot be built from given parameters
    IO              // local stream failure
  };
};

std::string KWErrorToString(KWError::Value err);

// Build an error of given kind, only TRANSPORT errors are retryable
ClientError<KWError::Value> MakeKWError(KWError::Value err,
                                        const std::string &message);

// Build a VENDOR_API error from classified codes
ClientError<KWError::Value> MakeVendorError(const APIError &apiError);

// Convert a non 2xx response into an error
//
// @param  : response, host which answered
// @return : VENDOR_API error if body carries error codes or status is 401,
//           UNEXPECTED_RESPONSE otherwise
ClientError<KWError::Value> GetKWErrorForResponse(
    const Http::HttpResponse &response, const std::string &host);

std::string GetMessageForKWError(const ClientError<KWError::Value> &error);
bool IsGoodKWError(const ClientError<KWError::Value> &error);

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_KWERROR_H_
