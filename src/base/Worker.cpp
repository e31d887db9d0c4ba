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

#include "base/Worker.h"

#include "boost/bind.hpp"

#include "base/ThreadPool.h"

namespace QSXfer {

namespace Threading {

// --------------------------------------------------------------------------
Worker::Worker(ThreadPool &threadPool)
    : m_threadPool(threadPool),
      m_thread(boost::bind(boost::type<void>(), &Worker::operator(), this)) {}

// --------------------------------------------------------------------------
Worker::~Worker() {
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

// --------------------------------------------------------------------------
void Worker::operator()() {
  Task task;
  while (m_threadPool.WaitForTask(&task)) {
    // packaged_task hands any exception to its future
    task();
    task.clear();
  }
}

}  // namespace Threading
}  // namespace QSXfer
