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

#include "client/APIError.h"

#include <stddef.h>

#include <sstream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/optional.hpp"
#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace KW {

namespace Client {

using boost::property_tree::ptree;
using boost::to_string;
using std::string;
using std::vector;

namespace {

struct CodeToFlag {
  const char *code;
  APIErrorFlag::Value flag;
};

// codes are kept in upper case
const CodeToFlag CODE_TABLE[] = {
    {"ERR_AUTH_UNAUTHORIZED", APIErrorFlag::AUTH_UNAUTHORIZED},
    {"UNAUTHORIZED_CLIENT", APIErrorFlag::AUTH_UNAUTHORIZED},
    {"ERR_AUTH_PROFILE_CHANGED", APIErrorFlag::AUTH_PROFILE_CHANGED},
    {"ERR_ACCESS_USER", APIErrorFlag::ACCESS_USER},
    {"INVALID_GRANT", APIErrorFlag::INVALID_GRANT},
    {"ERR_INVALID_GRANT", APIErrorFlag::INVALID_GRANT},
    {"ERR_ENTITY_DELETED_PERMANENTLY",
     APIErrorFlag::ENTITY_DELETED_PERMANENTLY},
    {"ERR_ENTITY_NOT_FOUND", APIErrorFlag::ENTITY_NOT_FOUND},
    {"ERR_ENTITY_DELETED", APIErrorFlag::ENTITY_DELETED},
    {"ERR_ENTITY_PARENT_FOLDER_DELETED",
     APIErrorFlag::ENTITY_PARENT_FOLDER_DELETED},
    {"ERR_REQUEST_METHOD_NOT_ALLOWED",
     APIErrorFlag::REQUEST_METHOD_NOT_ALLOWED},
    {"ERR_ENTITY_EXISTS", APIErrorFlag::ENTITY_EXISTS},
    {"ERR_ENTITY_ROLE_IS_ASSIGNED", APIErrorFlag::ENTITY_ROLE_IS_ASSIGNED},
    {"UNAVAILABLE", APIErrorFlag::UNAVAILABLE},
    {"SERVICE_UNAVAILABLE", APIErrorFlag::SERVICE_UNAVAILABLE},
    {"ERR_ENTITY_NOT_SCANNED", APIErrorFlag::ENTITY_NOT_SCANNED},
    {"ERR_ENTITY_PARENT_FOLDER_MEMBER_EXISTS",
     APIErrorFlag::ENTITY_PARENT_FOLDER_MEMBER_EXISTS},
};

const char *INTERNAL_ERROR_MARKER = "ERR_INTERNAL_";

}  // namespace

// --------------------------------------------------------------------------
bool LookupAPIErrorFlag(const string &code, APIErrorFlag::Value *flag) {
  string upper = KW::StringUtils::ToUpper(code);
  size_t n = sizeof(CODE_TABLE) / sizeof(CODE_TABLE[0]);
  for (size_t i = 0; i < n; ++i) {
    if (upper == CODE_TABLE[i].code) {
      if (flag != NULL) {
        *flag = CODE_TABLE[i].flag;
      }
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
void APIError::AddError(const string &code, const string &message) {
  string upper = KW::StringUtils::ToUpper(code);
  APIErrorFlag::Value flag;
  if (LookupAPIErrorFlag(upper, &flag)) {
    m_flags.Set(flag);
  } else if (upper.find(INTERNAL_ERROR_MARKER) != string::npos) {
    m_flags.Set(APIErrorFlag::INTERNAL_SERVER_ERROR);
  }
  m_messages.push_back(message + ". (kiteworks:" + upper + ")");
}

// --------------------------------------------------------------------------
void APIError::AddError(APIErrorFlag::Value flag, const string &message) {
  m_flags.Set(flag);
  m_messages.push_back(message);
}

// --------------------------------------------------------------------------
string APIError::ToString() const {
  if (m_messages.size() == 1) {
    return m_messages.front();
  }
  vector<string> lines;
  for (size_t i = 0; i < m_messages.size(); ++i) {
    lines.push_back("[" + to_string(i) + "] " + m_messages[i]);
  }
  return KW::StringUtils::Join(lines, "\n");
}

// --------------------------------------------------------------------------
bool ParseAPIErrorBody(const string &body, APIError *error) {
  if (body.empty() || error == NULL) {
    return false;
  }

  ptree tree;
  try {
    std::istringstream in(body);
    boost::property_tree::read_json(in, tree);
  } catch (const boost::property_tree::ptree_error &err) {
    DebugInfo("Response body is not a json error payload: " << err.what());
    return false;
  }

  bool found = false;
  boost::optional<ptree &> errors = tree.get_child_optional("errors");
  if (errors) {
    BOOST_FOREACH(const ptree::value_type &entry, *errors) {
      string code = entry.second.get<string>("code", "");
      string message = entry.second.get<string>("message", "");
      if (code.empty() && message.empty()) {
        continue;
      }
      error->AddError(code, message);
      found = true;
    }
  }

  string description = tree.get<string>("error_description", "");
  if (!description.empty()) {
    error->AddError(tree.get<string>("error", ""), description);
    found = true;
  }
  return found;
}

}  // namespace Client
}  // namespace KW
