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

#ifndef QSXFER_BASE_LOGGING_H_
#define QSXFER_BASE_LOGGING_H_

#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

// Declare in global namespace before class Log, since friend declarations
// can only introduce names in the surrounding namespace.
extern void LoggingInitializer();

namespace QSXfer {

namespace Logging {

//
// Log
//
// Initialize must be called to get log ready, it's a one-time initialization.
// Specify a directory to log message to files under it,
// or log message to console with no specifying.
//
class Log : public Singleton<Log> {
 public:
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  // Initialize
  //
  // @param  : log dir, empty to log to console
  // @return : none
  //
  // Throw QSXferException if the log dir is not creatable or writable.
  void Initialize(const std::string &logdir = std::string());

 private:
  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }
  void DoInitialize(const std::string &logdir);
  void ClearLogDirectory() const;

 private:
  Log()
      : m_logLevel(LogLevel::Info),
        m_logDirectory(std::string()),
        m_isDebug(false) {}

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // log to console if it's empty
  bool m_isDebug;

  friend void ::LoggingInitializer();
  friend class LoggingTest;
  friend class Singleton<Log>;
};

}  // namespace Logging
}  // namespace QSXfer

#endif  // QSXFER_BASE_LOGGING_H_
