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

#ifndef QSXFER_BASE_THREADPOOL_H_
#define QSXFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <deque>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/make_shared.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Macros for emulating Variadic Template in C++03
//
#define NUM_PARAMETERS 6
#define PARAMETERS(Z, N, D) \
  BOOST_PP_COMMA_IF(N)      \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)
#define FORWARD(Z, N, D) \
  BOOST_PP_COMMA_IF(N)   \
  boost::forward<BOOST_PP_CAT(A, N)>(BOOST_PP_CAT(a, N))

namespace QSXfer {

namespace Threading {

//
// Generate PackageFunctor1, ..., PackageFunctorN
// N = NUM_PARAMETERS
//
#define EXPAND(N)                                                          \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>               \
  struct BOOST_PP_CAT(PackageFunctor, N) {                                 \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ReturnType;                                                        \
    boost::shared_ptr<boost::packaged_task<ReturnType> > m_task;           \
    BOOST_PP_CAT(PackageFunctor, N)                                        \
    (const boost::shared_ptr<boost::packaged_task<ReturnType> >& task)     \
        : m_task(task) {}                                                  \
    void operator()() { (*m_task)(); }                                     \
  };

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, NUM_PARAMETERS)  // starting from 1
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

class Worker;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of workers pull tasks from one FIFO queue, so no more than
// poolSize tasks ever run at the same time and a task never starts before the
// ones submitted ahead of it. Workers start with the pool. The destructor lets
// the workers drain the queue and then joins them.
//
class ThreadPool : private boost::noncopyable {
 public:
  // Throw boost::thread_resource_error if a worker thread cannot be created,
  // the workers started before it are joined first.
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }

//
// Perfect Forward and Variadic Template Emulation in C++03
//
#define EXPAND(N)                                                           \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>                \
  boost::unique_future<                                                     \
      typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type>       \
  SubmitCallable(F f, BOOST_PP_REPEAT(N, PARAMETERS, ~)) {                  \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type  \
        ReturnType;                                                         \
    boost::shared_ptr<boost::packaged_task<ReturnType> > task =             \
        boost::make_shared<boost::packaged_task<ReturnType> >(boost::bind(  \
            boost::type<ReturnType>(), f, BOOST_PP_REPEAT(N, FORWARD, ~))); \
    SubmitToThread(boost::bind(boost::type<void>(),                         \
                               BOOST_PP_CAT(PackageFunctor, N) < F,         \
                               BOOST_PP_ENUM_PARAMS(N, A) > (task)));       \
    return task->get_future();                                              \
  }

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, NUM_PARAMETERS)
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

 private:
  void SubmitToThread(const Task& task);

  // Block until a task is available or the pool is stopping
  //
  // @param  : task to fill
  // @return : false if the pool is stopping and the queue is empty
  bool WaitForTask(Task* task);

  bool HasTasks();

  // Tell workers to exit once the queue is drained
  void StopProcessing();

  // Join and free the workers, StopProcessing must be called first
  void DeleteWorkers();

 private:
  size_t m_poolSize;
  bool m_stopping;
  std::deque<Task> m_tasks;
  boost::mutex m_queueLock;
  boost::condition_variable m_queueConditionVar;
  std::vector<Worker*> m_workers;

  friend class Worker;
  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace QSXfer

#undef FORWARD
#undef PARAMETERS
#undef NUM_PARAMETERS

#endif  // QSXFER_BASE_THREADPOOL_H_
