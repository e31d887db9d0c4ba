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

#include <sstream>

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "configure/Options.h"

// --------------------------------------------------------------------------
void LoggingInitializer() {
  const QSXfer::Configure::Options &options =
      QSXfer::Configure::Options::Instance();
  QSXfer::Logging::Log &log = QSXfer::Logging::Log::Instance();
  if (options.IsForeground()) {
    log.Initialize();
  } else {
    log.Initialize(options.GetLogDirectory());
  }
  log.SetDebug(options.IsDebug());
  log.SetLogLevel(options.GetLogLevel());
  if (options.IsClearLogDir()) {
    log.ClearLogDirectory();
  }

  std::stringstream ss;
  ss << "<<Options>> " << options;
  DebugInfo(ss.str());
}
