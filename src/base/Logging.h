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

#ifndef KWCLIENT_BASE_LOGGING_H_
#define KWCLIENT_BASE_LOGGING_H_

#include <string>

#include "boost/noncopyable.hpp"

namespace KW {

namespace Logging {

// Values line up with glog severities so they can be assigned to
// FLAGS_minloglevel directly.
struct LogLevel {
  enum Value { Info = 0, Warn = 1, Error = 2, Fatal = 3 };
};

// Level name, one of {INFO, WARN, ERROR, FATAL}, empty when out of range
std::string GetLogLevelName(LogLevel::Value level);

// Parse a level name, ignoring case and surrounding spaces. "warning" is
// accepted for Warn. Unknown names give Info.
LogLevel::Value GetLogLevelByName(const std::string &name);

// "[NAME] ", put in front of every logged line
std::string GetLogLevelPrefix(LogLevel::Value level);

//
// Log
//
// Process wide logging state of kwclient. glog is set up once by Initialize;
// level and debug switch may change at any time. Debug* macros log only
// while debug is on.
//
class Log : private boost::noncopyable {
 public:
  static Log &Instance();

  // Set up glog under the given directory, or on stderr when it is empty.
  // Later calls are ignored.
  //
  // Throws KWException if the directory cannot be created or written.
  void Initialize(const std::string &logdir = std::string());

  bool LogsToConsole() const { return m_logDirectory.empty(); }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  void SetLogLevel(LogLevel::Value level);
  void SetLogLevel(const std::string &name) {
    SetLogLevel(GetLogLevelByName(name));
  }

  bool IsDebug() const { return m_isDebug; }
  void SetDebug(bool debug) { m_isDebug = debug; }

 private:
  Log() : m_logLevel(LogLevel::Info), m_isDebug(false) {}

  static void CreateInstance();
  void DoInitialize(const std::string &logdir);

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // empty while logging to stderr
  bool m_isDebug;

  friend class LoggingTest;
};

}  // namespace Logging
}  // namespace KW

#endif  // KWCLIENT_BASE_LOGGING_H_
