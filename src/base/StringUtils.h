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

#ifndef KWCLIENT_BASE_STRINGUTILS_H_
#define KWCLIENT_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>
#include <vector>

namespace KW {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Join strings with separator
//
// @param  : strings, separator
// @return : joined string, e.g. {"a", "b"} with "," gives "a,b"
std::string Join(const std::vector<std::string> &strs,
                 const std::string &separator);

// Replace every occurrence of 'from' in 'str' with 'to'
std::string ReplaceAll(const std::string &str, const std::string &from,
                       const std::string &to);

// Format byte count in 1000 based units
//
// @param  : bytes
// @return : string like "1.5MB", one of {Bytes, KB, MB, GB}
std::string HumanSize(int64_t bytes);

}  // namespace StringUtils
}  // namespace KW

#endif  // KWCLIENT_BASE_STRINGUTILS_H_
