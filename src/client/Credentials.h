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

#ifndef KWCLIENT_CLIENT_CREDENTIALS_H_
#define KWCLIENT_CLIENT_CREDENTIALS_H_

#include <string>

namespace KW {

namespace Client {

//
// Credentials
//
// Application secrets kept encrypted in memory under a key generated when
// the object is made. Set secrets before the session is used by more than
// one thread.
//
class Credentials {
 public:
  Credentials();

 public:
  void SetClientSecret(const std::string &secret);
  void SetSignatureKey(const std::string &key);

  std::string GetClientSecret() const { return Decrypt(m_clientSecret); }
  std::string GetSignatureKey() const { return Decrypt(m_signatureKey); }
  bool HasSignatureKey() const { return !m_signatureKey.empty(); }

 private:
  std::string Encrypt(const std::string &plain) const;
  std::string Decrypt(const std::string &cipher) const;
  std::string Crypt(const std::string &input, bool encrypt) const;

 private:
  std::string m_key;           // 256 bits
  std::string m_clientSecret;  // cipher text
  std::string m_signatureKey;  // cipher text

  friend class CredentialsTest;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_CREDENTIALS_H_
