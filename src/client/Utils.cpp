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

#include "client/Utils.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "configure/Default.h"

namespace QSXfer {

namespace Client {

namespace Utils {

using boost::to_string;
using QSXfer::Configure::Default::GetDefaultParallelLargeFileDownloadLimit;
using QSXfer::Configure::Default::GetLargeFileDefaultChunkSize;
using QSXfer::Configure::Default::GetLargeFileSizeThreshold;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t stop) {
  DebugWarningIf(stop < start, "Invalid input with stop before start");
  // format: "bytes=start_offset-stop_offset"
  // e.g. bytes=0-0 return the first byte
  string range = "bytes=";
  range += to_string(start);
  range += "-";
  range += to_string(stop);
  return range;
}

// --------------------------------------------------------------------------
vector<ByteRange> BuildChunkRanges(uint64_t size, uint64_t chunkSize) {
  vector<ByteRange> ranges;
  if (size == 0) {
    return ranges;
  }
  if (chunkSize == 0 || chunkSize > size) {
    chunkSize = size;
  }

  ranges.reserve((size + chunkSize - 1) / chunkSize);
  for (uint64_t start = 0; start < size; start += chunkSize) {
    uint64_t stop = start + chunkSize - 1;
    if (stop > size - 1) {
      stop = size - 1;  // clamp the last one
    }
    ranges.push_back(ByteRange(start, stop));
  }
  return ranges;
}

// --------------------------------------------------------------------------
ChunkPlan PlanChunks(uint64_t objectSize, uint64_t chunkSize,
                     size_t concurrencyLimit) {
  ChunkPlan plan;
  plan.m_chunkSize = chunkSize > 0 ? chunkSize : GetLargeFileDefaultChunkSize();
  plan.m_concurrency = concurrencyLimit > 0
                           ? concurrencyLimit
                           : GetDefaultParallelLargeFileDownloadLimit();

  if (objectSize < GetLargeFileSizeThreshold()) {
    plan.m_chunkSize = objectSize;
    plan.m_concurrency = 1;
  }
  plan.m_ranges = BuildChunkRanges(objectSize, plan.m_chunkSize);
  return plan;
}

}  // namespace Utils
}  // namespace Client
}  // namespace QSXfer
