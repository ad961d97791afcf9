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

#ifndef KWCLIENT_BASE_HASHUTILS_H_
#define KWCLIENT_BASE_HASHUTILS_H_

#include <stddef.h>

#include <string>

namespace KW {

namespace HashUtils {

// Cryptographically strong random bytes
//
// @param  : count of bytes
// @return : bytes, throws CryptoException if the generator fails
std::string RandomBytes(size_t count);

// Hex of count random bytes
std::string RandomHex(size_t count);

// HMAC-SHA1 of data under key, lower case hex
std::string HmacSHA1Hex(const std::string &key, const std::string &data);

// Standard base64 with padding
std::string Base64Encode(const std::string &data);

}  // namespace HashUtils
}  // namespace KW

#endif  // KWCLIENT_BASE_HASHUTILS_H_
