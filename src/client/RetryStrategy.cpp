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

#include "client/RetryStrategy.h"

#include <stdint.h>

#include "client/APIError.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(const ClientError<KWError::Value> &error,
                                uint16_t attemptedRetryTimes) const {
  if (attemptedRetryTimes >= m_maxRetryTimes) {
    return false;
  }
  return error.ShouldRetry() || ShouldReauthenticate(error);
}

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldReauthenticate(
    const ClientError<KWError::Value> &error) const {
  return error.HasAPIError(REAUTH_RETRY_MASK);
}

// --------------------------------------------------------------------------
uint32_t RetryStrategy::CalculateDelayBeforeNextRetry(
    uint16_t attemptedRetryTimes) const {
  uint32_t n = attemptedRetryTimes;
  return n * n * m_backoffUnit;
}

// --------------------------------------------------------------------------
RetryStrategy GetDefaultRetryStrategy() {
  return RetryStrategy(KW::Configure::Default::GetDefaultRetries(),
                       KW::Configure::Default::GetRetryBackoffUnit());
}

}  // namespace Client
}  // namespace KW
