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

#ifndef KWCLIENT_CONFIGURE_DEFAULT_H_
#define KWCLIENT_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <string>

namespace KW {

namespace Configure {

namespace Default {

const char* GetProgramName();
std::string GetDefaultAgentString();
uint32_t GetMaxLogSizeInMB();

int GetDefaultAPIVersion();  // used when a call asks for version 0
int GetInitiateUploadAPIVersion();
int GetTransferAPIVersion();  // chunk upload and content download

uint16_t GetDefaultRetries();
uint32_t GetDefaultRequestTimeout();  // in milliseconds
uint32_t GetDefaultConnectTimeout();  // in milliseconds
uint32_t GetRetryBackoffUnit();       // in milliseconds

uint64_t GetMinChunkSize();
uint64_t GetMaxChunkSize();
size_t GetUploadRelayBufferSize();
size_t GetDownloadBufferSize();

uint32_t GetTransferDisplayInterval();  // in milliseconds
size_t GetTransferShortNameLength();
size_t GetProgressBarWidth();

}  // namespace Default
}  // namespace Configure
}  // namespace KW

#endif  // KWCLIENT_CONFIGURE_DEFAULT_H_
