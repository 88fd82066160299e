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

#ifndef QSXFER_BASE_TASKHANDLE_H_
#define QSXFER_BASE_TASKHANDLE_H_

#include "boost/noncopyable.hpp"
#include "boost/thread/thread.hpp"

namespace QSX {

namespace Threading {

class ThreadPool;

// One worker thread of a ThreadPool. Joined on destruction.
class TaskHandle : private boost::noncopyable {
 public:
  explicit TaskHandle(ThreadPool &threadPool);  // NOLINT
  ~TaskHandle();

 private:
  void operator()();

 private:
  ThreadPool &m_threadPool;
  boost::thread m_thread;

  friend class ThreadPool;
};

}  // namespace Threading
}  // namespace QSX

#endif  // QSXFER_BASE_TASKHANDLE_H_
