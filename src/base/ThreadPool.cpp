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

#include "base/ThreadPool.h"

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/TaskHandle.h"

namespace QSX {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::unique_lock;

// --------------------------------------------------------------------------
ThreadPool::ThreadPool(size_t poolSize)
    : m_poolSize(poolSize > 0 ? poolSize : 1), m_stopped(false) {
  for (size_t i = 0; i < m_poolSize; ++i) {
    m_taskHandles.push_back(new TaskHandle(*this));
  }
}

// --------------------------------------------------------------------------
ThreadPool::~ThreadPool() {
  StopProcessing();
  BOOST_FOREACH(TaskHandle *taskHandle, m_taskHandles) { delete taskHandle; }
  m_taskHandles.clear();
}

// --------------------------------------------------------------------------
void ThreadPool::SubmitToThread(const Task &task) {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_tasks.push_back(task);
  }
  m_queueCond.notify_one();
}

// --------------------------------------------------------------------------
bool ThreadPool::WaitForTask(Task *task) {
  unique_lock<mutex> lock(m_queueLock);
  m_queueCond.wait(
      lock, boost::bind(boost::type<bool>(), &ThreadPool::IsReadyOrStopped,
                        this));
  if (m_stopped) {
    return false;
  }
  task->swap(m_tasks.front());
  m_tasks.pop_front();
  return true;
}

// --------------------------------------------------------------------------
bool ThreadPool::IsReadyOrStopped() const {
  return m_stopped || !m_tasks.empty();
}

// --------------------------------------------------------------------------
void ThreadPool::StopProcessing() {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_stopped = true;
  }
  m_queueCond.notify_all();
}

}  // namespace Threading
}  // namespace QSX
