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

#ifndef QSXFER_CLIENT_UTILS_H_
#define QSXFER_CLIENT_UTILS_H_

#include <stddef.h>  // for size_t
#include <stdint.h>

#include <string>
#include <vector>

#include "client/TransferOptions.h"

namespace QSXfer {

namespace Client {

namespace Utils {

// Build request header of 'Range'
//
// @param  : start, stop (inclusive)
// @return : string with format of "bytes=start_offset-stop_offset"
std::string BuildRequestRange(uint64_t start, uint64_t stop);

// Split an object into ranged requests
//
// @param  : object size, chunk size
// @return : ceil(size / chunkSize) contiguous inclusive ranges
//
// Ranges cover [0, size) exactly once, the last stop is clamped to size - 1.
// A zero size gives no range, a zero chunk size gives one range.
std::vector<ByteRange> BuildChunkRanges(uint64_t size, uint64_t chunkSize);

struct ChunkPlan {
  uint64_t m_chunkSize;
  size_t m_concurrency;
  std::vector<ByteRange> m_ranges;
};

// Decide how to download an object of the given size
//
// @param  : object size, requested chunk size, requested concurrency
// @return : chunk plan
//
// Objects smaller than the large file threshold are fetched with one request
// and concurrency 1. Zero chunk size or concurrency fall back to the defaults.
ChunkPlan PlanChunks(uint64_t objectSize, uint64_t chunkSize,
                     size_t concurrencyLimit);

}  // namespace Utils
}  // namespace Client
}  // namespace QSXfer


#endif  // QSXFER_CLIENT_UTILS_H_
