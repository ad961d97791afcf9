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

#include "configure/Default.h"

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace KW {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "kwclient";
static const char* const KWCLIENT_DEFAULT_AGENT = "kwclient/1.0";
static const uint32_t KWCLIENT_MAX_LOG_SIZE_MB = 100;

static const int KW_API_VERSION_DEFAULT = 11;
static const int KW_API_VERSION_INITIATE_UPLOAD = 5;
static const int KW_API_VERSION_TRANSFER = 7;

static const uint16_t KWCLIENT_DEFAULT_RETRIES = 3;
static const uint32_t KWCLIENT_DEFAULT_REQUEST_TIMEOUT = 60 * 1000;
static const uint32_t KWCLIENT_DEFAULT_CONNECT_TIMEOUT = 30 * 1000;
static const uint32_t KWCLIENT_RETRY_BACKOFF_UNIT = 1000;

// The service rejects chunks above 65MB
static const uint64_t KWCLIENT_MIN_CHUNK_SIZE = 1024 * 1024;
static const uint64_t KWCLIENT_MAX_CHUNK_SIZE = 65 * 1024 * 1024;
static const size_t KWCLIENT_UPLOAD_RELAY_BUFFER = 4 * 1024;
static const size_t KWCLIENT_DOWNLOAD_BUFFER = 16 * 1024;

static const uint32_t KWCLIENT_TRANSFER_DISPLAY_INTERVAL = 200;
static const size_t KWCLIENT_TRANSFER_SHORT_NAME_LEN = 8;
static const size_t KWCLIENT_PROGRESS_BAR_WIDTH = 25;

const char* GetProgramName() { return PROGRAM_NAME; }
string GetDefaultAgentString() { return KWCLIENT_DEFAULT_AGENT; }
uint32_t GetMaxLogSizeInMB() { return KWCLIENT_MAX_LOG_SIZE_MB; }

int GetDefaultAPIVersion() { return KW_API_VERSION_DEFAULT; }
int GetInitiateUploadAPIVersion() { return KW_API_VERSION_INITIATE_UPLOAD; }
int GetTransferAPIVersion() { return KW_API_VERSION_TRANSFER; }

uint16_t GetDefaultRetries() { return KWCLIENT_DEFAULT_RETRIES; }
uint32_t GetDefaultRequestTimeout() { return KWCLIENT_DEFAULT_REQUEST_TIMEOUT; }
uint32_t GetDefaultConnectTimeout() { return KWCLIENT_DEFAULT_CONNECT_TIMEOUT; }
uint32_t GetRetryBackoffUnit() { return KWCLIENT_RETRY_BACKOFF_UNIT; }

uint64_t GetMinChunkSize() { return KWCLIENT_MIN_CHUNK_SIZE; }
uint64_t GetMaxChunkSize() { return KWCLIENT_MAX_CHUNK_SIZE; }
size_t GetUploadRelayBufferSize() { return KWCLIENT_UPLOAD_RELAY_BUFFER; }
size_t GetDownloadBufferSize() { return KWCLIENT_DOWNLOAD_BUFFER; }

uint32_t GetTransferDisplayInterval() {
  return KWCLIENT_TRANSFER_DISPLAY_INTERVAL;
}
size_t GetTransferShortNameLength() { return KWCLIENT_TRANSFER_SHORT_NAME_LEN; }
size_t GetProgressBarWidth() { return KWCLIENT_PROGRESS_BAR_WIDTH; }

}  // namespace Default
}  // namespace Configure
}  // namespace KW
