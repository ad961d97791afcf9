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

#ifndef KWCLIENT_BASE_TIMEUTILS_H_
#define KWCLIENT_BASE_TIMEUTILS_H_

#include <stdint.h>
#include <time.h>

#include <string>

namespace KW {

namespace TimeUtils {

// Convert service timestamp to time in seconds
//
// @param  : date string like "2017-08-01T10:20:30+0000" or with 'Z' suffix
// @param  : output seconds since epoch (UTC)
// @return : false if the date cannot be parsed
bool KWTimeToSeconds(const std::string &date, time_t *seconds);

// Convert time to service timestamp
//
// @param  : time in seconds
// @return : date string like "2017-08-01T10:20:30+0000"
std::string SecondsToKWTime(time_t time);

// Check if an absolute expiry has passed
//
// @param  : expiry in seconds since epoch, 0 means never
// @return : bool
bool IsExpired(time_t expiry);

}  // namespace TimeUtils
}  // namespace KW


#endif  // KWCLIENT_BASE_TIMEUTILS_H_
