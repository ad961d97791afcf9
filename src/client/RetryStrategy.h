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

#ifndef KWCLIENT_CLIENT_RETRYSTRATEGY_H_
#define KWCLIENT_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "client/KWError.h"

namespace KW {

namespace Client {

class RetryStrategy {
 public:
  // @param  : max retry times, backoff unit in milliseconds
  RetryStrategy(uint16_t maxRetryTimes, uint32_t backoffUnit)
      : m_maxRetryTimes(maxRetryTimes), m_backoffUnit(backoffUnit) {}

  // Transport errors and errors needing a reauthentication are retried
  // until the budget is used up.
  bool ShouldRetry(const ClientError<KWError::Value> &error,
                   uint16_t attemptedRetryTimes) const;

  // Internal server errors and token errors ask for a fresh token first.
  bool ShouldReauthenticate(const ClientError<KWError::Value> &error) const;

  // Square of attempts in backoff units, e.g. 1s, 4s, 9s
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }

 private:
  RetryStrategy() {}
  uint16_t m_maxRetryTimes;
  uint32_t m_backoffUnit;
};

RetryStrategy GetDefaultRetryStrategy();

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_RETRYSTRATEGY_H_
