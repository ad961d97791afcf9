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

#include "base/HashUtils.h"

#include <stdio.h>

#include <string>
#include <vector>

#include "openssl/evp.h"
#include "openssl/hmac.h"
#include "openssl/rand.h"

#include "base/Exception.h"

namespace KW {

namespace HashUtils {

using KW::Exception::CryptoException;
using std::string;
using std::vector;

namespace {

string ToHex(const unsigned char *data, size_t len) {
  string hex;
  hex.reserve(len * 2);
  char buf[3] = "";
  for (size_t i = 0; i < len; ++i) {
    snprintf(buf, sizeof(buf), "%02x", data[i]);
    hex.append(buf, 2);
  }
  return hex;
}

}  // namespace

// --------------------------------------------------------------------------
string RandomBytes(size_t count) {
  vector<unsigned char> buf(count == 0 ? 1 : count);
  if (RAND_bytes(&buf[0], static_cast<int>(count)) != 1) {
    throw CryptoException("Unable to gather random bytes");
  }
  return string(reinterpret_cast<const char *>(&buf[0]), count);
}

// --------------------------------------------------------------------------
string RandomHex(size_t count) {
  string bytes = RandomBytes(count);
  return ToHex(reinterpret_cast<const unsigned char *>(bytes.data()), count);
}

// --------------------------------------------------------------------------
string HmacSHA1Hex(const string &key, const string &data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int mdLen = 0;
  if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()), data.size(),
           md, &mdLen) == NULL) {
    throw CryptoException("Unable to compute HMAC-SHA1");
  }
  return ToHex(md, mdLen);
}

// --------------------------------------------------------------------------
string Base64Encode(const string &data) {
  if (data.empty()) {
    return string();
  }
  vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(&out[0],
                          reinterpret_cast<const unsigned char *>(data.data()),
                          static_cast<int>(data.size()));
  return string(reinterpret_cast<const char *>(&out[0]), n);
}

}  // namespace HashUtils
}  // namespace KW
