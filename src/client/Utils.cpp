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

#include "client/Utils.h"

#include <stddef.h>

#include <sstream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "nlohmann/json.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Constants.h"

namespace KW {

namespace Client {

namespace Utils {

using boost::to_string;
using nlohmann::ordered_json;
using std::istream;
using std::string;
using std::vector;

namespace {

template <char C>
istream &expect(istream &in) {
  if ((in >> std::ws).peek() == C) {
    in.ignore();
  } else {
    in.setstate(std::ios_base::failbit);
  }
  return in;
}

const char *const SECRET_FIELDS[] = {"access_token", "refresh_token",
                                     "client_secret", "password", "code",
                                     "signature"};

string RedactForm(const string &body) {
  std::istringstream in(body);
  vector<string> pairs;
  for (string pair; std::getline(in, pair, '&');) {
    string::size_type eq = pair.find('=');
    if (eq != string::npos && IsSecretField(pair.substr(0, eq))) {
      pair = pair.substr(0, eq + 1) + Constants::RedactedValue;
    }
    pairs.push_back(pair);
  }
  return KW::StringUtils::Join(pairs, "&");
}

}  // namespace

// --------------------------------------------------------------------------
string BuildRequestRangeStart(int64_t start) {
  // format of "bytes=start_offset-"
  string range = "bytes=";
  range += to_string(start);
  range += "-";
  return range;
}

// --------------------------------------------------------------------------
bool ParseResponseContentRangeStart(const string &contentRange,
                                    int64_t *start) {
  string cpy(KW::StringUtils::Trim(contentRange, ' '));
  if (cpy.compare(0, 5, "bytes") != 0 || cpy.find('-') == string::npos) {
    DebugWarning("Invalid content range: " + cpy);
    return false;
  }
  cpy = cpy.substr(5);  // remove leading "bytes"
  int64_t offset = 0;
  std::istringstream in(cpy);
  if (in >> offset >> expect<'-'>) {
    if (offset < 0) {
      DebugWarning("Invalid content range: " + contentRange);
      return false;
    }
    *start = offset;
    return true;
  }
  DebugWarning("Invalid content range: " + contentRange);
  return false;
}

// --------------------------------------------------------------------------
bool IsSecretField(const string &name) {
  string lower = KW::StringUtils::ToLower(name);
  size_t n = sizeof(SECRET_FIELDS) / sizeof(SECRET_FIELDS[0]);
  for (size_t i = 0; i < n; ++i) {
    if (lower == SECRET_FIELDS[i]) {
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
string RedactSecrets(const string &body) {
  string trimmed = KW::StringUtils::Trim(body, ' ');
  if (trimmed.empty()) {
    return body;
  }

  if (trimmed[0] != '{') {
    return trimmed.find('=') != string::npos ? RedactForm(trimmed) : body;
  }

  ordered_json tree;
  try {
    tree = ordered_json::parse(trimmed);
  } catch (const nlohmann::json::exception &err) {
    return body;
  }
  if (!tree.is_object()) {
    return body;
  }

  for (ordered_json::iterator it = tree.begin(); it != tree.end(); ++it) {
    if (IsSecretField(it.key())) {
      *it = Constants::RedactedValue;
    }
  }
  return tree.dump();
}

}  // namespace Utils
}  // namespace Client
}  // namespace KW
