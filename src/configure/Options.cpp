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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogLevel.h"
#include "configure/Default.h"

namespace QSXfer {

namespace Configure {

using boost::to_string;
using QSXfer::Configure::Default::GetDefaultLogDirectory;
using QSXfer::Configure::Default::GetDefaultLogLevelName;
using QSXfer::Configure::Default::GetDefaultMaxLogSizeInMB;
using QSXfer::Logging::GetLogLevelByName;
using QSXfer::Logging::GetLogLevelName;
using std::ostream;

// --------------------------------------------------------------------------
Options::Options()
    : m_logDirectory(GetDefaultLogDirectory()),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_maxLogSizeInMB(GetDefaultMaxLogSizeInMB()),
      m_clearLogDir(false),
      m_foreground(false),
      m_debug(false) {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  return os << "[log directory: " << opts.m_logDirectory << "] "
            << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
            << "[max log size(MB): " << to_string(opts.m_maxLogSizeInMB)
            << "] " << std::boolalpha
            << "[clear logdir: " << opts.m_clearLogDir << "] "
            << "[foreground: " << opts.m_foreground << "] "
            << "[debug: " << opts.m_debug << "]" << std::noboolalpha;
}

}  // namespace Configure
}  // namespace QSXfer
