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

#ifndef KWCLIENT_CLIENT_APIERROR_H_
#define KWCLIENT_CLIENT_APIERROR_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "base/BitFlag.hpp"

namespace KW {

namespace Client {

// Categories of application level errors reported in response bodies.
struct APIErrorFlag {
  enum Value {
    AUTH_UNAUTHORIZED = 1 << 0,
    AUTH_PROFILE_CHANGED = 1 << 1,
    ACCESS_USER = 1 << 2,
    INVALID_GRANT = 1 << 3,
    ENTITY_DELETED_PERMANENTLY = 1 << 4,
    ENTITY_NOT_FOUND = 1 << 5,
    ENTITY_DELETED = 1 << 6,
    ENTITY_PARENT_FOLDER_DELETED = 1 << 7,
    REQUEST_METHOD_NOT_ALLOWED = 1 << 8,
    INTERNAL_SERVER_ERROR = 1 << 9,
    ENTITY_EXISTS = 1 << 10,
    ENTITY_ROLE_IS_ASSIGNED = 1 << 11,
    UNAVAILABLE = 1 << 12,
    SERVICE_UNAVAILABLE = 1 << 13,
    ENTITY_NOT_SCANNED = 1 << 14,
    ENTITY_PARENT_FOLDER_MEMBER_EXISTS = 1 << 15
  };
};

// Errors which are cured by getting a new access token.
static const uint32_t TOKEN_ERROR_MASK = APIErrorFlag::AUTH_UNAUTHORIZED |
                                         APIErrorFlag::AUTH_PROFILE_CHANGED |
                                         APIErrorFlag::INVALID_GRANT;

// Errors worth a reauthentication and another attempt.
static const uint32_t REAUTH_RETRY_MASK =
    TOKEN_ERROR_MASK | APIErrorFlag::INTERNAL_SERVER_ERROR;

//
// APIError
//
// Union of classified categories plus every message, in arrival order.
//
class APIError {
 public:
  APIError() {}

 public:
  // Classify an error code and record its message
  //
  // @param  : error code (case insensitive), message
  // @return : none
  //
  // Unknown codes containing "ERR_INTERNAL_" are taken as internal server
  // errors; other unknown codes only contribute the message.
  void AddError(const std::string &code, const std::string &message);

  // Record a message with a known category, e.g. for a bare 401
  void AddError(APIErrorFlag::Value flag, const std::string &message);

  bool Has(uint32_t mask) const { return m_flags.HasAny(mask); }
  bool IsTokenError() const { return Has(TOKEN_ERROR_MASK); }
  bool IsEmpty() const { return m_flags.IsEmpty() && m_messages.empty(); }
  uint32_t GetFlags() const { return m_flags.GetBits(); }
  const std::vector<std::string> &GetMessages() const { return m_messages; }

  // A single message as is, several ones as "[i] msg" lines
  std::string ToString() const;

 private:
  BitFlag<APIErrorFlag> m_flags;
  std::vector<std::string> m_messages;
};

// Map error code to category
//
// @param  : error code, case insensitive
// @param  : output category
// @return : false if code is not in the table
bool LookupAPIErrorFlag(const std::string &code, APIErrorFlag::Value *flag);

// Extract vendor errors from a response body
//
// @param  : body, in form of
//           {"error": "...", "error_description": "...",
//            "errors": [{"code": "...", "message": "..."}]}
// @param  : error to add into
// @return : false if body carries no error entries
bool ParseAPIErrorBody(const std::string &body, APIError *error);

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_APIERROR_H_
