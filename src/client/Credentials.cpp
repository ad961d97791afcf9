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

#include "client/Credentials.h"

#include <string>
#include <vector>

#include "openssl/evp.h"

#include "base/Exception.h"
#include "base/HashUtils.h"

namespace KW {

namespace Client {

using KW::Exception::CryptoException;
using std::string;
using std::vector;

namespace {

const size_t CREDENTIALS_KEY_LEN = 32;

class CipherContext {
 public:
  CipherContext() : m_ctx(EVP_CIPHER_CTX_new()) {}
  ~CipherContext() {
    if (m_ctx != NULL) {
      EVP_CIPHER_CTX_free(m_ctx);
    }
  }
  EVP_CIPHER_CTX *Get() const { return m_ctx; }

 private:
  EVP_CIPHER_CTX *m_ctx;
};

}  // namespace

// --------------------------------------------------------------------------
Credentials::Credentials()
    : m_key(KW::HashUtils::RandomBytes(CREDENTIALS_KEY_LEN)) {}

// --------------------------------------------------------------------------
void Credentials::SetClientSecret(const string &secret) {
  m_clientSecret = Encrypt(secret);
}

// --------------------------------------------------------------------------
void Credentials::SetSignatureKey(const string &key) {
  m_signatureKey = Encrypt(key);
}

// --------------------------------------------------------------------------
string Credentials::Encrypt(const string &plain) const {
  return plain.empty() ? string() : Crypt(plain, true);
}

// --------------------------------------------------------------------------
string Credentials::Decrypt(const string &cipher) const {
  return cipher.empty() ? string() : Crypt(cipher, false);
}

// --------------------------------------------------------------------------
string Credentials::Crypt(const string &input, bool encrypt) const {
  const EVP_CIPHER *cipher = EVP_aes_256_cfb128();
  const unsigned char *key =
      reinterpret_cast<const unsigned char *>(m_key.data());
  // iv is the leading block of the key
  const unsigned char *iv = key;

  CipherContext ctx;
  if (ctx.Get() == NULL ||
      EVP_CipherInit_ex(ctx.Get(), cipher, NULL, key, iv, encrypt ? 1 : 0) !=
          1) {
    throw CryptoException("Unable to initialize credentials cipher");
  }

  vector<unsigned char> out(input.size() + EVP_MAX_BLOCK_LENGTH);
  int outLen = 0;
  int finalLen = 0;
  if (EVP_CipherUpdate(ctx.Get(), &out[0], &outLen,
                       reinterpret_cast<const unsigned char *>(input.data()),
                       static_cast<int>(input.size())) != 1 ||
      EVP_CipherFinal_ex(ctx.Get(), &out[0] + outLen, &finalLen) != 1) {
    throw CryptoException("Unable to process credentials");
  }
  return string(reinterpret_cast<const char *>(&out[0]), outLen + finalLen);
}

}  // namespace Client
}  // namespace KW
