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

#ifndef QSXFER_DATA_LOCALFILE_H_
#define QSXFER_DATA_LOCALFILE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

namespace QSXfer {

namespace Data {

//
// LocalFile
//
// A local file opened once for positional writes. WriteAt may be called from
// several threads at the same time, each one writing its own offset. The
// descriptor is released exactly once, by Close or by the destructor.
//
class LocalFile : private boost::noncopyable {
 public:
  explicit LocalFile(const std::string &path);
  ~LocalFile();

 public:
  // Open the file for read and write, create or truncate it
  //
  // @param  : void
  // @return : {true, ""} or {false, message}
  std::pair<bool, std::string> Open();

  // Write at offset
  //
  // @param  : data, length, file offset
  // @return : {true, ""} or {false, message}
  std::pair<bool, std::string> WriteAt(const char *data, size_t len,
                                       uint64_t offset);

  // Close the file, no op if it is not open
  //
  // @param  : void
  // @return : {true, ""} or {false, message}
  std::pair<bool, std::string> Close();

  bool IsOpen() const;
  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
  int m_fd;  // -1 when closed
  mutable boost::mutex m_fdLock;
};

}  // namespace Data
}  // namespace QSXfer

#endif  // QSXFER_DATA_LOCALFILE_H_
