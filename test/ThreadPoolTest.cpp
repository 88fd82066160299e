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

#include <stddef.h>

#include <set>
#include <string>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/ThreadPool.h"

namespace QSX {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using std::set;
using std::string;
using ::testing::Test;

static const size_t poolSize = 3;

// Results handed back by the workers
struct Collected {
  Collected() : count(0), sum(0) {}

  void Add(int result, int arg) {
    {
      lock_guard<mutex> lock(m_lock);
      ++count;
      sum += result;
      args.insert(arg);
      threads.insert(boost::this_thread::get_id());
    }
    m_cond.notify_all();
  }

  void WaitFor(size_t n) {
    boost::unique_lock<mutex> lock(m_lock);
    while (count < n) {
      m_cond.wait(lock);
    }
  }

  size_t count;
  int sum;
  set<int> args;
  set<boost::thread::id> threads;
  mutex m_lock;
  boost::condition_variable m_cond;
};

int Square(int n) { return n * n; }

int SlowSquare(int n) {
  boost::this_thread::sleep(boost::posix_time::milliseconds(20));
  return n * n;
}

string Describe(const string &prefix, int n) {
  return prefix + char('0' + n);
}

class ThreadPoolTest : public Test {
 protected:
  void SetUp() { m_pool = new ThreadPool(poolSize); }

  void TearDown() { delete m_pool; }

  // A stopped pool runs nothing queued after the stop
  void TestStopped() {
    m_pool->StopProcessing();
    bool ran = false;
    m_pool->SubmitToThread(boost::bind(&ThreadPoolTest::Mark, &ran));
    Task task;
    EXPECT_FALSE(m_pool->WaitForTask(&task));
    boost::this_thread::sleep(boost::posix_time::milliseconds(50));
    EXPECT_FALSE(ran);
  }

  static void Mark(bool *ran) { *ran = true; }

  ThreadPool *m_pool;
};

TEST_F(ThreadPoolTest, Stopped) { TestStopped(); }

TEST_F(ThreadPoolTest, PoolSize) {
  EXPECT_EQ(m_pool->GetPoolSize(), poolSize);
  ThreadPool pool(0);
  EXPECT_EQ(pool.GetPoolSize(), 1u);
}

TEST_F(ThreadPoolTest, SubmitAsync) {
  Collected collected;
  for (int i = 1; i <= 10; ++i) {
    m_pool->SubmitAsync(boost::bind(&Collected::Add, &collected, _1, _2),
                        Square, i);
  }
  collected.WaitFor(10);
  EXPECT_EQ(collected.sum, 385);
  EXPECT_EQ(collected.args.size(), 10u);
}

TEST_F(ThreadPoolTest, SubmitAsyncSpreadsOverWorkers) {
  Collected collected;
  for (int i = 0; i < static_cast<int>(poolSize) * 4; ++i) {
    m_pool->SubmitAsync(boost::bind(&Collected::Add, &collected, _1, _2),
                        SlowSquare, i);
  }
  collected.WaitFor(poolSize * 4);
  EXPECT_GT(collected.threads.size(), 1u);
  EXPECT_LE(collected.threads.size(), poolSize);
}

struct Received {
  void operator()(const string &result, const string &prefix, int n) {
    lock_guard<mutex> lock(*m_lock);
    *m_result = result;
    *m_prefix = prefix;
    *m_n = n;
  }
  mutex *m_lock;
  string *m_result;
  string *m_prefix;
  int *m_n;
};

TEST_F(ThreadPoolTest, SubmitAsyncPassesArgsToHandler) {
  mutex lock;
  string result;
  string prefix;
  int n = 0;
  Received handler = {&lock, &result, &prefix, &n};
  {
    ThreadPool pool(1);
    pool.SubmitAsync(handler, Describe, string("part-"), 7);
    boost::this_thread::sleep(boost::posix_time::milliseconds(50));
  }
  lock_guard<mutex> guard(lock);
  EXPECT_EQ(result, "part-7");
  EXPECT_EQ(prefix, "part-");
  EXPECT_EQ(n, 7);
}

TEST_F(ThreadPoolTest, DestructorJoinsWorkers) {
  Collected collected;
  {
    ThreadPool pool(2);
    pool.SubmitAsync(boost::bind(&Collected::Add, &collected, _1, _2),
                     SlowSquare, 3);
    collected.WaitFor(1);
  }
  EXPECT_EQ(collected.sum, 9);
}

}  // namespace Threading
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
