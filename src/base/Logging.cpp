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

#include <iostream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace {

void InitializeGLog() {
  google::InitGoogleLogging(QSXfer::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

}  // namespace

namespace QSXfer {

namespace Logging {

using QSXfer::Exception::QSXferException;
using std::pair;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

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
    FLAGS_colorlogtostderr = true;
  } else {
    if (!QSXfer::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw QSXferException("Unable to create log directory " + logdir +
                            " : " + strerror(errno));
    }

    m_logDirectory = QSXfer::Utils::AppendPathDelim(logdir);
    // glog picks up most FLAGS_* at once, but the destination related ones
    // must be set before google::InitGoogleLogging.
    FLAGS_log_dir = m_logDirectory;
    FLAGS_max_log_size =
        QSXfer::Configure::Options::Instance().GetMaxLogSizeInMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  InitializeGLog();
}

// --------------------------------------------------------------------------
void Log::ClearLogDirectory() const {
  if (m_logDirectory.empty()) {
    std::cerr << "Log message to console, nothing to clear" << std::endl;
    return;
  }

  pair<bool, string> outcome =
      QSXfer::Utils::DeleteFilesInDirectory(m_logDirectory, false);
  if (!outcome.first) {
    std::cerr << "Unable to clear log directory : ";
    std::cerr << outcome.second << ". But Continue..." << std::endl;
  }
}

}  // namespace Logging
}  // namespace QSXfer
