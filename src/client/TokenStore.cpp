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

#include "client/TokenStore.h"

#include <map>
#include <string>

#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace KW {

namespace Client {

using std::map;
using std::string;

// --------------------------------------------------------------------------
ClientError<KWError::Value> MemoryTokenStore::Save(const string &username,
                                                   const AuthToken &token) {
  boost::lock_guard<boost::mutex> lock(m_lock);
  m_tokens[username] = token;
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> MemoryTokenStore::Load(const string &username,
                                                   AuthToken *token) {
  if (token == NULL) {
    return MakeKWError(KWError::PARAMETER, "null token output");
  }
  boost::lock_guard<boost::mutex> lock(m_lock);
  map<string, AuthToken>::const_iterator it = m_tokens.find(username);
  *token = it == m_tokens.end() ? AuthToken() : it->second;
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> MemoryTokenStore::Delete(const string &username) {
  boost::lock_guard<boost::mutex> lock(m_lock);
  m_tokens.erase(username);
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
