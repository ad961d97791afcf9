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

#ifndef KWCLIENT_CLIENT_TOKENSTORE_H_
#define KWCLIENT_CLIENT_TOKENSTORE_H_

#include <time.h>

#include <map>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/KWError.h"

namespace KW {

namespace Client {

struct AuthToken {
  AuthToken() : expires(0) {}

  bool IsEmpty() const { return accessToken.empty(); }

  std::string accessToken;
  std::string refreshToken;
  time_t expires;  // seconds since epoch, 0 if unknown
};

//
// TokenStore
//
// Persists tokens per user. Errors only report storage failures, a user
// without token gets an empty AuthToken.
//
class TokenStore : private boost::noncopyable {
 public:
  virtual ~TokenStore() {}

  virtual ClientError<KWError::Value> Save(const std::string &username,
                                           const AuthToken &token) = 0;
  virtual ClientError<KWError::Value> Load(const std::string &username,
                                           AuthToken *token) = 0;
  virtual ClientError<KWError::Value> Delete(const std::string &username) = 0;
};

// Tokens live as long as the process
class MemoryTokenStore : public TokenStore {
 public:
  MemoryTokenStore() {}

  ClientError<KWError::Value> Save(const std::string &username,
                                   const AuthToken &token);
  ClientError<KWError::Value> Load(const std::string &username,
                                   AuthToken *token);
  ClientError<KWError::Value> Delete(const std::string &username);

 private:
  boost::mutex m_lock;
  std::map<std::string, AuthToken> m_tokens;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_TOKENSTORE_H_
