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

#ifndef KWCLIENT_CLIENT_CONSTANTS_H_
#define KWCLIENT_CLIENT_CONSTANTS_H_

namespace KW {

namespace Client {

namespace Constants {

static const char *const APIVersionHeader = "X-Accellion-Version";
static const char *const ContentTypeForm = "application/x-www-form-urlencoded";
static const char *const ContentTypeJSON = "application/json";
static const char *const ContentTypeOctetStream = "application/octet-stream";

static const char *const OAuthTokenPath = "/oauth/token";

// Replaces secrets in traces
static const char *const RedactedValue = "[HIDDEN]";

}  // namespace Constants
}  // namespace Client
}  // namespace KW


#endif  // KWCLIENT_CLIENT_CONSTANTS_H_
