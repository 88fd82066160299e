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

#include "base/ConcurrencyGate.h"

#include "boost/bind.hpp"
#include "boost/thread/locks.hpp"

namespace QSX {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::unique_lock;

// --------------------------------------------------------------------------
Permit::~Permit() { Release(); }

// --------------------------------------------------------------------------
void Permit::Release() {
  if (!m_released) {
    m_released = true;
    m_gate->ReturnPermit();
  }
}

// --------------------------------------------------------------------------
shared_ptr<ConcurrencyGate> ConcurrencyGate::Create(size_t budget) {
  return shared_ptr<ConcurrencyGate>(new ConcurrencyGate(budget));
}

// --------------------------------------------------------------------------
PermitPtr ConcurrencyGate::Acquire() {
  {
    unique_lock<mutex> lock(m_lock);
    m_freeCond.wait(lock, boost::bind(boost::type<bool>(),
                                      &ConcurrencyGate::HasFreePermit, this));
    ++m_inUse;
    if (m_inUse > m_peakInUse) {
      m_peakInUse = m_inUse;
    }
  }
  return PermitPtr(new Permit(shared_from_this()));
}

// --------------------------------------------------------------------------
size_t ConcurrencyGate::GetInUse() const {
  lock_guard<mutex> lock(m_lock);
  return m_inUse;
}

// --------------------------------------------------------------------------
size_t ConcurrencyGate::GetPeakInUse() const {
  lock_guard<mutex> lock(m_lock);
  return m_peakInUse;
}

// --------------------------------------------------------------------------
void ConcurrencyGate::ReturnPermit() {
  {
    lock_guard<mutex> lock(m_lock);
    if (m_inUse > 0) {
      --m_inUse;
    }
  }
  m_freeCond.notify_one();
}

// --------------------------------------------------------------------------
bool ConcurrencyGate::HasFreePermit() const { return m_inUse < m_budget; }

}  // namespace Threading
}  // namespace QSX
