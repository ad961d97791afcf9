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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include "boost/bind.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "configure/Default.h"

namespace KW {

namespace Logging {

using KW::Exception::KWException;
using std::string;

namespace {

const char *const LOG_LEVEL_NAMES[] = {"INFO", "WARN", "ERROR", "FATAL"};

boost::once_flag instanceOnce = BOOST_ONCE_INIT;
boost::once_flag initOnce = BOOST_ONCE_INIT;
boost::scoped_ptr<Log> instance;

bool CreateLogDirectory(const string &logdir) {
  struct stat st;
  if (stat(logdir.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }
  return mkdir(logdir.c_str(), S_IRWXU | S_IRGRP | S_IXGRP) == 0 ||
         errno == EEXIST;
}

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value level) {
  int idx = static_cast<int>(level);
  if (idx < LogLevel::Info || idx > LogLevel::Fatal) {
    return string();
  }
  return LOG_LEVEL_NAMES[idx];
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  string upper = KW::StringUtils::ToUpper(KW::StringUtils::Trim(name, ' '));
  if (upper == "WARNING") {
    return LogLevel::Warn;
  }
  for (int i = LogLevel::Info; i <= LogLevel::Fatal; ++i) {
    if (upper == LOG_LEVEL_NAMES[i]) {
      return static_cast<LogLevel::Value>(i);
    }
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value level) {
  return "[" + GetLogLevelName(level) + "] ";
}

// --------------------------------------------------------------------------
Log &Log::Instance() {
  boost::call_once(instanceOnce, &Log::CreateInstance);
  return *instance;
}

// --------------------------------------------------------------------------
void Log::CreateInstance() { instance.reset(new Log); }

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
  } else {
    if (!CreateLogDirectory(logdir)) {
      throw KWException("Unable to create log directory " + logdir + " : " +
                        strerror(errno));
    }
    if (access(logdir.c_str(), W_OK) != 0) {
      throw KWException("Could not create logging file at " + logdir +
                        ": Permission denied");
    }
    m_logDirectory = logdir;
    // FLAGS_log_dir only takes effect before google::InitGoogleLogging.
    FLAGS_log_dir = logdir;
    FLAGS_max_log_size = KW::Configure::Default::GetMaxLogSizeInMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  google::InitGoogleLogging(KW::Configure::Default::GetProgramName());
}

}  // namespace Logging
}  // namespace KW
