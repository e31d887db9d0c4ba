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

#include "data/LocalFile.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>  // for strerror
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace QSXfer {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using QSXfer::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

namespace {

const mode_t FILE_MODE = (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
LocalFile::LocalFile(const string &path) : m_path(path), m_fd(-1) {}

// --------------------------------------------------------------------------
LocalFile::~LocalFile() {
  pair<bool, string> outcome = Close();
  ErrorIf(!outcome.first, outcome.second);
}

// --------------------------------------------------------------------------
pair<bool, string> LocalFile::Open() {
  lock_guard<mutex> lock(m_fdLock);
  if (m_fd >= 0) {
    return make_pair(true, string());
  }
  int fd = open(m_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, FILE_MODE);
  if (fd < 0) {
    return make_pair(false, "Fail to open file " + PostErrMsg(m_path));
  }
  m_fd = fd;
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<bool, string> LocalFile::WriteAt(const char *data, size_t len,
                                      uint64_t offset) {
  int fd = -1;
  {
    lock_guard<mutex> lock(m_fdLock);
    fd = m_fd;
  }
  if (fd < 0) {
    return make_pair(false, "File is not open " + FormatPath(m_path));
  }

  size_t written = 0;
  while (written < len) {
    ssize_t ret = pwrite(fd, data + written, len - written,
                         static_cast<off_t>(offset + written));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_pair(false, "Fail to write file at offset " +
                                  to_string(offset + written) +
                                  PostErrMsg(m_path));
    }
    written += static_cast<size_t>(ret);
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<bool, string> LocalFile::Close() {
  lock_guard<mutex> lock(m_fdLock);
  if (m_fd < 0) {
    return make_pair(true, string());
  }
  int fd = m_fd;
  m_fd = -1;  // released even if close reports an error
  if (close(fd) != 0) {
    return make_pair(false, "Fail to close file " + PostErrMsg(m_path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool LocalFile::IsOpen() const {
  lock_guard<mutex> lock(m_fdLock);
  return m_fd >= 0;
}

}  // namespace Data
}  // namespace QSXfer
