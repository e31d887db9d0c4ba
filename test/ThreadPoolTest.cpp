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

#include <stddef.h>
#include <stdlib.h>  // for exit
#include <sys/resource.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/ThreadPool.h"

namespace QSXfer {

namespace Threading {

// Fixture lives in the namespace of ThreadPool to be its friend.

using boost::lock_guard;
using boost::mutex;
using boost::unique_future;
using std::vector;
using ::testing::Test;

// Return n!. For negative, n! is defined to be 1;
int Factorial(int n) {
  int result = 1;
  for (int i = 1; i <= n; ++i) {
    result *= i;
  }
  return result;
}

int Add(int a, int b) { return a + b; }

int Throw(int n) {
  throw std::runtime_error("task failure");
  return n;
}

void Sleep(int ms) {
  boost::this_thread::sleep(boost::posix_time::milliseconds(ms));
}

//
// Records execution order and the peak number of tasks running together
//
class Recorder {
 public:
  Recorder() : m_inFlight(0), m_peak(0) {}

  void Run(int id, int ms) {
    {
      lock_guard<mutex> lock(m_lock);
      ++m_inFlight;
      m_peak = std::max(m_peak, m_inFlight);
      m_order.push_back(id);
    }
    Sleep(ms);
    {
      lock_guard<mutex> lock(m_lock);
      --m_inFlight;
    }
  }

  size_t GetPeak() {
    lock_guard<mutex> lock(m_lock);
    return m_peak;
  }

  vector<int> GetOrder() {
    lock_guard<mutex> lock(m_lock);
    return m_order;
  }

 private:
  size_t m_inFlight;
  size_t m_peak;
  vector<int> m_order;
  mutex m_lock;
};

static const size_t poolSize_ = 2;

class ThreadPoolTest : public Test {
 protected:
  void SetUp() { m_pThreadPool = new ThreadPool(poolSize_); }

  void TearDown() { delete m_pThreadPool; }

  // test private member
  void TestHasTasks() {
    EXPECT_FALSE(m_pThreadPool->HasTasks());

    // occupy both workers, the third task has to wait in queue
    Recorder recorder;
    m_pThreadPool->SubmitCallable(
        boost::bind(&Recorder::Run, &recorder, _1, _2), 1, 200);
    m_pThreadPool->SubmitCallable(
        boost::bind(&Recorder::Run, &recorder, _1, _2), 2, 200);
    Sleep(50);
    m_pThreadPool->SubmitCallable(
        boost::bind(&Recorder::Run, &recorder, _1, _2), 3, 0);
    EXPECT_TRUE(m_pThreadPool->HasTasks());

    // destructor drains the queue
    delete m_pThreadPool;
    m_pThreadPool = NULL;
    EXPECT_EQ(3u, recorder.GetOrder().size());
  }

 protected:
  ThreadPool *m_pThreadPool;
};

TEST_F(ThreadPoolTest, TestHasTasks) { TestHasTasks(); }

TEST_F(ThreadPoolTest, TestPoolSize) {
  EXPECT_EQ(poolSize_, m_pThreadPool->GetPoolSize());
  ThreadPool pool(0);
  EXPECT_EQ(1u, pool.GetPoolSize());
}

TEST_F(ThreadPoolTest, TestSubmitCallable) {
  unique_future<int> f1 = m_pThreadPool->SubmitCallable(Factorial, 5);
  unique_future<int> f2 = m_pThreadPool->SubmitCallable(Add, 1, 11);
  EXPECT_EQ(120, f1.get());
  EXPECT_EQ(12, f2.get());
}

TEST_F(ThreadPoolTest, TestExceptionGoesToFuture) {
  unique_future<int> f = m_pThreadPool->SubmitCallable(Throw, 1);
  EXPECT_THROW(f.get(), std::runtime_error);

  // workers survive
  unique_future<int> f1 = m_pThreadPool->SubmitCallable(Factorial, 4);
  EXPECT_EQ(24, f1.get());
}

int result = 0;
boost::mutex lockResult;

void Add2(const int &v1, const int &v2) {
  boost::lock_guard<boost::mutex> locker(lockResult);
  result += v1 + v2;
}

TEST_F(ThreadPoolTest, TestQueueDrainedOnDestruction) {
  {
    ThreadPool pool(2);
    for (int i = 0; i < 10; ++i) {
      pool.SubmitCallable(Add2, 1, 10);
    }
  }
  boost::lock_guard<boost::mutex> locker(lockResult);
  EXPECT_EQ(110, result);
}

TEST_F(ThreadPoolTest, TestFifoWithSingleWorker) {
  Recorder recorder;
  {
    ThreadPool pool(1);
    for (int i = 0; i < 8; ++i) {
      pool.SubmitCallable(boost::bind(&Recorder::Run, &recorder, _1, _2), i, 1);
    }
  }
  vector<int> order = recorder.GetOrder();
  ASSERT_EQ(8u, order.size());
  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ(i, order[i]);
  }
  EXPECT_EQ(1u, recorder.GetPeak());
}

TEST_F(ThreadPoolTest, TestConcurrencyBounded) {
  Recorder recorder;
  {
    ThreadPool pool(3);
    for (int i = 0; i < 12; ++i) {
      pool.SubmitCallable(boost::bind(&Recorder::Run, &recorder, _1, _2), i,
                          20);
    }
  }
  EXPECT_EQ(12u, recorder.GetOrder().size());
  EXPECT_LE(recorder.GetPeak(), 3u);
  EXPECT_GE(recorder.GetPeak(), 1u);
}

// Each worker maps its stack when it starts, so a small address space lets
// only the first few workers of a large pool start.
void LimitAddressSpace(rlim_t bytes) {
  struct rlimit limit;
  if (getrlimit(RLIMIT_AS, &limit) != 0) {
    exit(2);
  }
  limit.rlim_cur = bytes;
  if (setrlimit(RLIMIT_AS, &limit) != 0) {
    exit(2);
  }
}

void StartPoolBeyondAddressSpace() {
  LimitAddressSpace(256 * 1024 * 1024);
  try {
    ThreadPool pool(1000);
  } catch (const std::exception &) {
    // started workers are joined, the pool state is gone cleanly
    exit(0);
  }
  exit(1);
}

TEST(ThreadPoolDeathTest, FailedStartJoinsStartedWorkers) {
  EXPECT_EXIT(StartPoolBeyondAddressSpace(), ::testing::ExitedWithCode(0),
              "");
}

}  // namespace Threading
}  // namespace QSXfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  int code = RUN_ALL_TESTS();
  return code;
}
