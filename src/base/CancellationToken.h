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

#ifndef QSXFER_BASE_CANCELLATIONTOKEN_H_
#define QSXFER_BASE_CANCELLATIONTOKEN_H_

#include "boost/noncopyable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace QSXfer {

namespace Threading {

//
// CancellationToken
//
// Shared by a caller and all tasks of one operation. Once cancelled it stays
// cancelled. Tasks which have not started their I/O yet check it and give up;
// tasks already doing I/O are not interrupted.
//
class CancellationToken : private boost::noncopyable {
 public:
  CancellationToken() : m_cancel(false) {}

 public:
  void Cancel() {
    boost::lock_guard<boost::mutex> locker(m_cancelLock);
    m_cancel = true;
  }

  bool IsCancelled() const {
    boost::lock_guard<boost::mutex> locker(m_cancelLock);
    return m_cancel;
  }

 private:
  bool m_cancel;
  mutable boost::mutex m_cancelLock;
};

}  // namespace Threading
}  // namespace QSXfer


#endif  // QSXFER_BASE_CANCELLATIONTOKEN_H_
