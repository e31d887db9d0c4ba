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

#ifndef QSXFER_BASE_SIZE_H_
#define QSXFER_BASE_SIZE_H_

#include <stdint.h>  // for unit64_t

namespace QSXfer {

namespace Size {

static const uint64_t MB1 = 1 * 1024 * 1024;
static const uint64_t MB10 = 10 * MB1;
static const uint64_t MB64 = 64 * MB1;
static const uint64_t MB100 = 100 * MB1;
static const uint64_t MB256 = 256 * MB1;

}  // namespace Size
}  // namespace QSXfer


#endif  // QSXFER_BASE_SIZE_H_
