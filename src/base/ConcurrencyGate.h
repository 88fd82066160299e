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

#ifndef QSXFER_BASE_CONCURRENCYGATE_H_
#define QSXFER_BASE_CONCURRENCYGATE_H_

#include <stddef.h>  // for size_t

#include "boost/enable_shared_from_this.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace QSX {

namespace Threading {

class ConcurrencyGate;

//
// Permit
//
// Proof of holding one slot of a ConcurrencyGate. The slot goes back to the
// gate on Release or, at the latest, when the permit is destroyed, so it is
// returned on every exit path of the holder.
//
class Permit : private boost::noncopyable {
 public:
  ~Permit();

  // Return the slot to the gate. Calling it more than once is harmless.
  void Release();

  bool IsReleased() const { return m_released; }

 private:
  explicit Permit(const boost::shared_ptr<ConcurrencyGate> &gate)
      : m_gate(gate), m_released(false) {}

  boost::shared_ptr<ConcurrencyGate> m_gate;
  bool m_released;

  friend class ConcurrencyGate;
};

typedef boost::shared_ptr<Permit> PermitPtr;

//
// ConcurrencyGate
//
// Counting semaphore bounding the number of in-flight chunk transfers.
// Acquire blocks while all permits are out. Must be created through Create
// as permits keep the gate alive.
//
class ConcurrencyGate : public boost::enable_shared_from_this<ConcurrencyGate>,
                        private boost::noncopyable {
 public:
  // Create a gate with budget permits, a budget of 0 is raised to 1
  static boost::shared_ptr<ConcurrencyGate> Create(size_t budget);

  ~ConcurrencyGate() {}

 public:
  // Block until a permit is available and take it
  PermitPtr Acquire();

  size_t GetBudget() const { return m_budget; }

  // Number of permits currently out
  size_t GetInUse() const;

  // Highest number of permits out at the same time so far
  size_t GetPeakInUse() const;

 private:
  explicit ConcurrencyGate(size_t budget)
      : m_budget(budget > 0 ? budget : 1), m_inUse(0), m_peakInUse(0) {}

  void ReturnPermit();
  bool HasFreePermit() const;  // m_lock must be held

 private:
  size_t m_budget;
  size_t m_inUse;
  size_t m_peakInUse;
  mutable boost::mutex m_lock;
  boost::condition_variable m_freeCond;

  friend class Permit;
};

}  // namespace Threading
}  // namespace QSX

#endif  // QSXFER_BASE_CONCURRENCYGATE_H_
