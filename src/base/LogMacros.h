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

#ifndef KWCLIENT_BASE_LOGMACROS_H_
#define KWCLIENT_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/Logging.h"

#ifdef DISABLE_KWCLIENT_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)
#define DebugFatal(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)
#define DebugFatalIf(condition, msg)

#else  // !DISABLE_KWCLIENT_LOGGING

#define KW_LOG_PREFIX(level) \
  KW::Logging::GetLogLevelPrefix(KW::Logging::LogLevel::level)

// INFO stream is flushed after every non-fatal message so that the log file
// always holds the latest lines, tests read it back right away.
#define KW_LOG_IMPL(severity, level, msg)             \
  {                                                   \
    LOG(severity) << KW_LOG_PREFIX(level) << msg;     \
    google::FlushLogFiles(google::INFO);              \
  }

#define KW_LOG_IF_IMPL(severity, level, condition, msg)             \
  {                                                                 \
    LOG_IF(severity, (condition)) << KW_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);                            \
  }

#define Info(msg) KW_LOG_IMPL(INFO, Info, msg)
#define Warning(msg) KW_LOG_IMPL(WARNING, Warn, msg)
#define Error(msg) KW_LOG_IMPL(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << KW_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) KW_LOG_IF_IMPL(INFO, Info, condition, msg)
#define WarningIf(condition, msg) KW_LOG_IF_IMPL(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) KW_LOG_IF_IMPL(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << KW_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg)                           \
  {                                              \
    if (KW::Logging::Log::Instance().IsDebug()) { \
      KW_LOG_IMPL(INFO, Info, msg)               \
    }                                            \
  }

#define DebugWarning(msg)                        \
  {                                              \
    if (KW::Logging::Log::Instance().IsDebug()) { \
      KW_LOG_IMPL(WARNING, Warn, msg)            \
    }                                            \
  }

#define DebugError(msg)                          \
  {                                              \
    if (KW::Logging::Log::Instance().IsDebug()) { \
      KW_LOG_IMPL(ERROR, Error, msg)             \
    }                                            \
  }

#define DebugFatal(msg)                                  \
  {                                                      \
    if (KW::Logging::Log::Instance().IsDebug()) {         \
      LOG(FATAL) << KW_LOG_PREFIX(Fatal) << msg;         \
    }                                                    \
  }

#define DebugInfoIf(condition, msg)                   \
  {                                                   \
    if (KW::Logging::Log::Instance().IsDebug()) {      \
      KW_LOG_IF_IMPL(INFO, Info, condition, msg)      \
    }                                                 \
  }

#define DebugWarningIf(condition, msg)                \
  {                                                   \
    if (KW::Logging::Log::Instance().IsDebug()) {      \
      KW_LOG_IF_IMPL(WARNING, Warn, condition, msg)   \
    }                                                 \
  }

#define DebugErrorIf(condition, msg)                  \
  {                                                   \
    if (KW::Logging::Log::Instance().IsDebug()) {      \
      KW_LOG_IF_IMPL(ERROR, Error, condition, msg)    \
    }                                                 \
  }

#define DebugFatalIf(condition, msg)                                \
  {                                                                 \
    if (KW::Logging::Log::Instance().IsDebug()) {                    \
      LOG_IF(FATAL, (condition)) << KW_LOG_PREFIX(Fatal) << msg;    \
    }                                                               \
  }

#endif  // DISABLE_KWCLIENT_LOGGING

#endif  // KWCLIENT_BASE_LOGMACROS_H_
