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

#ifndef QSXFER_CLIENT_TRANSFEROPTIONS_H_
#define QSXFER_CLIENT_TRANSFEROPTIONS_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"

#include "base/CancellationToken.h"
#include "client/ObjectHandle.h"
#include "client/ObjectMetaData.h"
#include "configure/Default.h"

namespace QSXfer {

namespace Client {

// Conditional request constraints attached to an upload.
// An unset field imposes no constraint.
struct PreconditionOptions {
  boost::optional<int64_t> m_ifGenerationMatch;  // 0 means must not exist
  boost::optional<int64_t> m_ifGenerationNotMatch;
  boost::optional<int64_t> m_ifMetagenerationMatch;
  boost::optional<int64_t> m_ifMetagenerationNotMatch;

  bool IsEmpty() const {
    return !m_ifGenerationMatch && !m_ifGenerationNotMatch &&
           !m_ifMetagenerationMatch && !m_ifMetagenerationNotMatch;
  }
};

// Inclusive byte range [m_start, m_end]
struct ByteRange {
  uint64_t m_start;
  uint64_t m_end;

  ByteRange(uint64_t start = 0, uint64_t end = 0)
      : m_start(start), m_end(end) {}

  uint64_t GetSize() const { return m_end - m_start + 1; }
  bool operator==(const ByteRange &rhs) const {
    return m_start == rhs.m_start && m_end == rhs.m_end;
  }
};

// Options of a single upload
struct UploadOptions {
  std::string m_destination;  // object key, empty to use the file base name
  std::string m_contentType;
  UserMetaData m_userMetaData;
  PreconditionOptions m_preconditions;
};

// Options of a single download
struct DownloadOptions {
  std::string m_destination;  // local file path, empty to keep in memory only
  boost::optional<ByteRange> m_range;
};

struct UploadMultiOptions {
  // Maximum number of uploads in flight, 0 to use the default
  size_t m_concurrencyLimit;

  // Object key is prefix joined with the base name of each file
  std::string m_prefix;

  // Only create the objects which do not exist yet
  bool m_skipIfExists;

  // Forwarded to every upload, copied per file before any change
  boost::optional<UploadOptions> m_passthroughOptions;

  boost::shared_ptr<QSXfer::Threading::CancellationToken> m_cancellationToken;

  UploadMultiOptions(
      size_t concurrencyLimit =
          QSXfer::Configure::Default::GetDefaultParallelUploadLimit(),
      const std::string &prefix = std::string(), bool skipIfExists = false)
      : m_concurrencyLimit(concurrencyLimit),
        m_prefix(prefix),
        m_skipIfExists(skipIfExists) {}
};

struct DownloadMultiOptions {
  // Maximum number of downloads in flight, 0 to use the default
  size_t m_concurrencyLimit;

  // Local path is prefix / passthrough destination / object key
  std::string m_prefix;

  // Local path is the object key with this literal leading text removed.
  // Takes precedence over m_prefix.
  std::string m_stripPrefix;

  // Forwarded to every download, copied per object before any change
  boost::optional<DownloadOptions> m_passthroughOptions;

  boost::shared_ptr<QSXfer::Threading::CancellationToken> m_cancellationToken;

  DownloadMultiOptions(
      size_t concurrencyLimit =
          QSXfer::Configure::Default::GetDefaultParallelDownloadLimit(),
      const std::string &prefix = std::string(),
      const std::string &stripPrefix = std::string())
      : m_concurrencyLimit(concurrencyLimit),
        m_prefix(prefix),
        m_stripPrefix(stripPrefix) {}
};

struct LargeFileDownloadOptions {
  // Maximum number of chunk downloads in flight, 0 to use the default
  size_t m_concurrencyLimit;

  // Bytes per ranged request, 0 to use the default
  uint64_t m_chunkSize;

  // Directory of the output file, empty for the working directory
  std::string m_destinationDirectory;

  boost::shared_ptr<QSXfer::Threading::CancellationToken> m_cancellationToken;

  LargeFileDownloadOptions(
      size_t concurrencyLimit = QSXfer::Configure::Default::
          GetDefaultParallelLargeFileDownloadLimit(),
      uint64_t chunkSize =
          QSXfer::Configure::Default::GetLargeFileDefaultChunkSize(),
      const std::string &destinationDirectory = std::string())
      : m_concurrencyLimit(concurrencyLimit),
        m_chunkSize(chunkSize),
        m_destinationDirectory(destinationDirectory) {}
};

// Build the options of one upload of a multi upload
//
// @param  : local file path, multi upload options
// @return : options owned by this upload only
//
// Starts from a copy of the passthrough options. skipIfExists sets
// ifGenerationMatch to 0 and leaves the other preconditions as they are.
// A prefix replaces the destination with prefix/basename(filePath).
UploadOptions BuildUploadOptions(const std::string &filePath,
                                 const UploadMultiOptions &options);

// Build the options of one download of a multi download
//
// @param  : object, multi download options
// @return : options owned by this download only
//
// A prefix gives prefix/destination/objectKey. A strip prefix gives the object
// key without its literal leading strip prefix and wins over the prefix.
DownloadOptions BuildDownloadOptions(const ObjectHandle &object,
                                     const DownloadMultiOptions &options);

}  // namespace Client
}  // namespace QSXfer

#endif  // QSXFER_CLIENT_TRANSFEROPTIONS_H_
