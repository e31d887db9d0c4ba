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

#ifndef QSXFER_CONFIGURE_OPTIONS_H_
#define QSXFER_CONFIGURE_OPTIONS_H_

#include <stdint.h>  // for uint32_t

#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace QSXfer {

namespace Configure {

using QSXfer::Logging::LogLevel;

// Process wide settings consumed by LoggingInitializer
class Options : public Singleton<Options> {
 public:
  ~Options() {}

 public:
  // accessor
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  uint32_t GetMaxLogSizeInMB() const { return m_maxLogSizeInMB; }
  bool IsClearLogDir() const { return m_clearLogDir; }
  bool IsForeground() const { return m_foreground; }
  bool IsDebug() const { return m_debug; }

  // mutator
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetMaxLogSizeInMB(uint32_t size) { m_maxLogSizeInMB = size; }
  void SetClearLogDir(bool clearLogDir) { m_clearLogDir = clearLogDir; }
  void SetForeground(bool foreground) { m_foreground = foreground; }
  void SetDebug(bool debug) { m_debug = debug; }

 private:
  Options();

  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  uint32_t m_maxLogSizeInMB;
  bool m_clearLogDir;
  bool m_foreground;  // log to console instead of log directory
  bool m_debug;

  friend class Singleton<Options>;
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace QSXfer

#endif  // QSXFER_CONFIGURE_OPTIONS_H_
