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

#ifndef QSXFER_BASE_LOGMACROS_H_
#define QSXFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_QSXFER_LOGGING
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

#else  // !DISABLE_QSXFER_LOGGING

#define QSXFER_LOG_PREFIX(level) \
  QSXfer::Logging::GetLogLevelPrefix(QSXfer::Logging::LogLevel::level)

// glog buffers INFO and WARNING; flush after every non-fatal message so the
// latest lines are always on disk when a transfer is inspected afterwards.
#define QSXFER_LOG(severity, level, msg)                    \
  {                                                         \
    LOG(severity) << QSXFER_LOG_PREFIX(level) << msg;       \
    google::FlushLogFiles(google::GLOG_INFO);               \
  }

#define QSXFER_LOG_IF(severity, level, condition, msg)                 \
  {                                                                    \
    LOG_IF(severity, (condition)) << QSXFER_LOG_PREFIX(level) << msg;  \
    google::FlushLogFiles(google::GLOG_INFO);                          \
  }

#define Info(msg) QSXFER_LOG(INFO, Info, msg)
#define Warning(msg) QSXFER_LOG(WARNING, Warn, msg)
#define Error(msg) QSXFER_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << QSXFER_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) QSXFER_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) QSXFER_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) QSXFER_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << QSXFER_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg)                                  \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      Info(msg);                                        \
    }                                                   \
  }

#define DebugWarning(msg)                               \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      Warning(msg);                                     \
    }                                                   \
  }

#define DebugError(msg)                                 \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      Error(msg);                                       \
    }                                                   \
  }

#define DebugFatal(msg)                                 \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      Fatal(msg);                                       \
    }                                                   \
  }

#define DebugInfoIf(condition, msg)                     \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      InfoIf(condition, msg);                           \
    }                                                   \
  }

#define DebugWarningIf(condition, msg)                  \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      WarningIf(condition, msg);                        \
    }                                                   \
  }

#define DebugErrorIf(condition, msg)                    \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      ErrorIf(condition, msg);                          \
    }                                                   \
  }

#define DebugFatalIf(condition, msg)                    \
  {                                                     \
    if (QSXfer::Logging::Log::Instance().IsDebug()) {   \
      FatalIf(condition, msg);                          \
    }                                                   \
  }

#endif  // DISABLE_QSXFER_LOGGING

#endif  // QSXFER_BASE_LOGMACROS_H_
