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

#include "base/TimeUtils.h"

#include <string.h>  // for memset
#include <time.h>    // for strftime

#include <string>

#include "base/StringUtils.h"

namespace KW {

namespace TimeUtils {

using std::string;

static const char *KW_TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";

// --------------------------------------------------------------------------
bool KWTimeToSeconds(const string &date, time_t *seconds) {
  if (date.empty() || seconds == NULL) {
    return false;
  }
  string utc = KW::StringUtils::ReplaceAll(date, "+0000", "Z");
  struct tm res;
  memset(&res, 0, sizeof(struct tm));

  const char *rest = strptime(utc.c_str(), KW_TIME_FORMAT, &res);
  if (rest == NULL || string(rest) != "Z") {
    return false;
  }
  *seconds = timegm(&res);
  return true;
}

// --------------------------------------------------------------------------
string SecondsToKWTime(time_t time) {
  char date[64];
  memset(date, 0, sizeof(date));

  struct tm res;
  gmtime_r(&time, &res);
  strftime(date, sizeof(date), KW_TIME_FORMAT, &res);
  return string(date) + "+0000";
}

// --------------------------------------------------------------------------
bool IsExpired(time_t expiry) {
  return expiry == 0 ? false : expiry <= time(NULL);
}

}  // namespace TimeUtils
}  // namespace KW
