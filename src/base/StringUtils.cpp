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

#include "base/StringUtils.h"

#include <stdio.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace KW {

namespace StringUtils {

using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string Join(const vector<string> &strs, const string &separator) {
  string joined;
  for (vector<string>::const_iterator it = strs.begin(); it != strs.end();
       ++it) {
    if (it != strs.begin()) {
      joined.append(separator);
    }
    joined.append(*it);
  }
  return joined;
}

// --------------------------------------------------------------------------
string ReplaceAll(const string &str, const string &from, const string &to) {
  if (from.empty()) {
    return str;
  }
  string copy(str);
  string::size_type pos = 0;
  while ((pos = copy.find(from, pos)) != string::npos) {
    copy.replace(pos, from.size(), to);
    pos += to.size();
  }
  return copy;
}

// --------------------------------------------------------------------------
string HumanSize(int64_t bytes) {
  static const char *units[] = {"Bytes", "KB", "MB", "GB"};
  static const size_t unitsCount = sizeof(units) / sizeof(units[0]);

  double size = static_cast<double>(bytes);
  size_t unit = 0;
  while (size >= 1000 && unit < unitsCount - 1) {
    size /= 1000;
    ++unit;
  }

  char buf[64] = "";
  snprintf(buf, sizeof(buf), "%.1f%s", size, units[unit]);
  return buf;
}

}  // namespace StringUtils
}  // namespace KW
