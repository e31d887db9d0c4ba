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

#include "base/LogLevel.h"

#include <string>

#include "base/StringUtils.h"

namespace QSXfer {

namespace Logging {

using std::string;

string GetLogLevelName(LogLevel::Value logLevel) {
  switch (logLevel) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    default:
      return string();
  }
}

LogLevel::Value GetLogLevelByName(const string &name) {
  string lower = QSXfer::StringUtils::ToLower(
      QSXfer::StringUtils::Trim(name, ' '));
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  } else if (lower == "error") {
    return LogLevel::Error;
  } else if (lower == "fatal") {
    return LogLevel::Fatal;
  }
  return LogLevel::Info;
}

string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace QSXfer
