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

#include "configure/Default.h"

#include <string>

#include "base/Size.h"

namespace QSXfer {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "qsxfer";
static const char* const QSXFER_DEFAULT_LOG_DIR = "/tmp/qsxfer_log/";
static const char* const QSXFER_DEFAULT_LOGLEVEL_NAME = "WARN";
static const uint32_t QSXFER_DEFAULT_MAX_LOG_SIZE_MB = 100;
static const size_t QSXFER_DEFAULT_PARALLEL_TRANSFERS = 2;

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogDirectory() { return QSXFER_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return QSXFER_DEFAULT_LOGLEVEL_NAME; }
uint32_t GetDefaultMaxLogSizeInMB() { return QSXFER_DEFAULT_MAX_LOG_SIZE_MB; }

size_t GetDefaultParallelUploadLimit() {
  return QSXFER_DEFAULT_PARALLEL_TRANSFERS;
}

size_t GetDefaultParallelDownloadLimit() {
  return QSXFER_DEFAULT_PARALLEL_TRANSFERS;
}

size_t GetDefaultParallelLargeFileDownloadLimit() {
  return QSXFER_DEFAULT_PARALLEL_TRANSFERS;
}

uint64_t GetLargeFileSizeThreshold() { return QSXfer::Size::MB256; }

uint64_t GetLargeFileDefaultChunkSize() { return QSXfer::Size::MB10; }

}  // namespace Default
}  // namespace Configure
}  // namespace QSXfer
