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

#include "base/ThreadPool.h"

#include <exception>

#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/Worker.h"

namespace QSXfer {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::unique_lock;

// --------------------------------------------------------------------------
ThreadPool::ThreadPool(size_t poolSize)
    : m_poolSize(poolSize > 0 ? poolSize : 1), m_stopping(false) {
  m_workers.reserve(m_poolSize);
  try {
    for (size_t i = 0; i < m_poolSize; ++i) {
      m_workers.push_back(new Worker(*this));
    }
  } catch (const std::exception &) {
    // Workers already running wait on this pool, join them before it goes
    StopProcessing();
    DeleteWorkers();
    throw;
  }
}

// --------------------------------------------------------------------------
ThreadPool::~ThreadPool() {
  StopProcessing();
  DeleteWorkers();
}

// --------------------------------------------------------------------------
void ThreadPool::DeleteWorkers() {
  // Worker joins its thread on destruction
  BOOST_FOREACH (Worker *worker, m_workers) { delete worker; }
  m_workers.clear();
}

// --------------------------------------------------------------------------
void ThreadPool::SubmitToThread(const Task &task) {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_tasks.push_back(task);
  }
  m_queueConditionVar.notify_one();
}

// --------------------------------------------------------------------------
bool ThreadPool::WaitForTask(Task *task) {
  unique_lock<mutex> lock(m_queueLock);
  while (!m_stopping && m_tasks.empty()) {
    m_queueConditionVar.wait(lock);
  }
  if (m_tasks.empty()) {
    return false;  // stopping and drained
  }
  task->swap(m_tasks.front());
  m_tasks.pop_front();
  return true;
}

// --------------------------------------------------------------------------
bool ThreadPool::HasTasks() {
  lock_guard<mutex> lock(m_queueLock);
  return !m_tasks.empty();
}

// --------------------------------------------------------------------------
void ThreadPool::StopProcessing() {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_stopping = true;
  }
  m_queueConditionVar.notify_all();
}

}  // namespace Threading
}  // namespace QSXfer
