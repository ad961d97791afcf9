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

#ifndef KWCLIENT_BASE_EXCEPTION_H_
#define KWCLIENT_BASE_EXCEPTION_H_

#include <stdexcept>
#include <string>

namespace KW {

namespace Exception {

// Failures that cannot be reported as a ClientError. Ordinary call
// failures never throw.
struct KWException : public std::runtime_error {
  explicit KWException(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised when a session can no longer operate without outside help,
// e.g. a token that cannot be refreshed or a broken token store wiring.
// Caller must restart the authentication flow.
struct ConfigurationException : public KWException {
  explicit ConfigurationException(const std::string& msg)
      : KWException(msg) {}
};

// OpenSSL refused an operation, random source or cipher
struct CryptoException : public KWException {
  explicit CryptoException(const std::string& msg) : KWException(msg) {}
};

}  // namespace Exception
}  // namespace KW

#endif  // KWCLIENT_BASE_EXCEPTION_H_
