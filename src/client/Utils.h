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

#ifndef KWCLIENT_CLIENT_UTILS_H_
#define KWCLIENT_CLIENT_UTILS_H_

#include <stdint.h>

#include <string>

namespace KW {

namespace Client {

namespace Utils {

// Build request header of 'Range'
//
// @param  : start
// @return : string with format of "bytes=start_offset-"
std::string BuildRequestRangeStart(int64_t start);

// Parse start offset of response header 'Content-Range'
//
// @param  : content range with format of "bytes start-stop/size", size and
//           stop may be missing or '*'
// @param  : output start offset
// @return : false if header is malformed
bool ParseResponseContentRangeStart(const std::string &contentRange,
                                    int64_t *start);

// Whether a field carries a secret, e.g. "access_token"
bool IsSecretField(const std::string &name);

// Mask secrets in a json or form encoded body for tracing
//
// @param  : body
// @return : body with every secret value replaced by "[HIDDEN]"
std::string RedactSecrets(const std::string &body);

}  // namespace Utils
}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_UTILS_H_
