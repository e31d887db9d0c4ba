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

#ifndef QSXFER_CONFIGURE_DEFAULT_H_
#define QSXFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <string>

namespace QSXfer {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
uint32_t GetDefaultMaxLogSizeInMB();

size_t GetDefaultParallelUploadLimit();
size_t GetDefaultParallelDownloadLimit();
size_t GetDefaultParallelLargeFileDownloadLimit();

// Objects at or above this size are downloaded in ranged chunks
uint64_t GetLargeFileSizeThreshold();
uint64_t GetLargeFileDefaultChunkSize();

}  // namespace Default
}  // namespace Configure
}  // namespace QSXfer

#endif  // QSXFER_CONFIGURE_DEFAULT_H_
