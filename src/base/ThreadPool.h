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

#ifndef QSXFER_BASE_THREADPOOL_H_
#define QSXFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <deque>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Macros for emulating variadic templates
//
#define QSXFER_POOL_MAX_ARGS 4
#define QSXFER_POOL_PARAM(Z, N, D) \
  BOOST_PP_COMMA_IF(N)             \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)

namespace QSX {

namespace Threading {

class TaskHandle;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of worker threads started on construction, all consuming
// one FIFO queue. The destructor stops the workers and joins them, tasks
// still queued at that point are dropped.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  void SubmitToThread(const Task &task);

  size_t GetPoolSize() const { return m_poolSize; }

//
// SubmitAsync(handler, f, args...) calls handler(f(args...), args...) on a
// worker. Args are copied once for f and once for handler.
//
#define EXPAND(N)                                                          \
  template <typename ReceivedHandler, typename F,                          \
            BOOST_PP_ENUM_PARAMS(N, typename A)>                           \
  void SubmitAsync(ReceivedHandler handler, F f,                           \
                   BOOST_PP_REPEAT(N, QSXFER_POOL_PARAM, ~)) {             \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ResultType;                                                        \
    SubmitToThread(boost::bind(                                            \
        boost::type<void>(), handler,                                      \
        boost::bind(boost::type<ResultType>(), f,                          \
                    BOOST_PP_ENUM_PARAMS(N, a)),                           \
        BOOST_PP_ENUM_PARAMS(N, a)));                                      \
  }

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, QSXFER_POOL_MAX_ARGS)
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

 private:
  // Block until a task is available or the pool is stopped.
  //
  // @param  : task [out]
  // @return : false if the pool is stopped
  bool WaitForTask(Task *task);

  bool IsReadyOrStopped() const;  // m_queueLock must be held

  // Stop the workers. Queued tasks will never run after this.
  void StopProcessing();

 private:
  size_t m_poolSize;
  bool m_stopped;
  std::deque<Task> m_tasks;
  boost::mutex m_queueLock;
  boost::condition_variable m_queueCond;
  std::vector<TaskHandle *> m_taskHandles;

  friend class TaskHandle;
  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace QSX

#undef QSXFER_POOL_PARAM
#undef QSXFER_POOL_MAX_ARGS

#endif  // QSXFER_BASE_THREADPOOL_H_
