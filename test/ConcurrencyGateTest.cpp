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

#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/ConcurrencyGate.h"

namespace QSX {

namespace Threading {

using boost::shared_ptr;
using std::vector;

TEST(ConcurrencyGateTest, Budget) {
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(3);
  EXPECT_EQ(gate->GetBudget(), 3u);
  EXPECT_EQ(gate->GetInUse(), 0u);

  shared_ptr<ConcurrencyGate> gate0 = ConcurrencyGate::Create(0);
  EXPECT_EQ(gate0->GetBudget(), 1u);
}

TEST(ConcurrencyGateTest, ReleaseOnDestroy) {
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(2);
  {
    PermitPtr p1 = gate->Acquire();
    PermitPtr p2 = gate->Acquire();
    EXPECT_EQ(gate->GetInUse(), 2u);
  }
  EXPECT_EQ(gate->GetInUse(), 0u);
  EXPECT_EQ(gate->GetPeakInUse(), 2u);
}

TEST(ConcurrencyGateTest, ReleaseIsIdempotent) {
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(2);
  PermitPtr p1 = gate->Acquire();
  PermitPtr p2 = gate->Acquire();
  p1->Release();
  p1->Release();
  EXPECT_TRUE(p1->IsReleased());
  EXPECT_FALSE(p2->IsReleased());
  EXPECT_EQ(gate->GetInUse(), 1u);
  p1.reset();
  EXPECT_EQ(gate->GetInUse(), 1u);
}

void ThrowWithPermit(const shared_ptr<ConcurrencyGate> &gate) {
  PermitPtr permit = gate->Acquire();
  throw std::runtime_error("chunk failed");
}

TEST(ConcurrencyGateTest, ReleaseOnException) {
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(1);
  for (int i = 0; i < 3; ++i) {
    EXPECT_THROW(ThrowWithPermit(gate), std::runtime_error);
    EXPECT_EQ(gate->GetInUse(), 0u);
  }
}

TEST(ConcurrencyGateTest, PermitKeepsGateAlive) {
  PermitPtr permit;
  {
    shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(1);
    permit = gate->Acquire();
  }
  permit->Release();
  EXPECT_TRUE(permit->IsReleased());
}

void AcquireAndSignal(const shared_ptr<ConcurrencyGate> &gate, bool *acquired,
                      boost::mutex *lock) {
  PermitPtr permit = gate->Acquire();
  boost::lock_guard<boost::mutex> locker(*lock);
  *acquired = true;
}

TEST(ConcurrencyGateTest, AcquireBlocksWhenExhausted) {
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(1);
  PermitPtr held = gate->Acquire();

  bool acquired = false;
  boost::mutex lock;
  boost::thread waiter(
      boost::bind(&AcquireAndSignal, gate, &acquired, &lock));
  boost::this_thread::sleep(boost::posix_time::milliseconds(50));
  {
    boost::lock_guard<boost::mutex> locker(lock);
    EXPECT_FALSE(acquired);
  }

  held->Release();
  waiter.join();
  EXPECT_TRUE(acquired);
  EXPECT_EQ(gate->GetInUse(), 0u);
}

// Tracks how many holders are inside the guarded section at once.
struct Occupancy {
  Occupancy() : current(0), peak(0) {}
  boost::mutex lock;
  size_t current;
  size_t peak;

  void Enter() {
    boost::lock_guard<boost::mutex> locker(lock);
    ++current;
    if (current > peak) {
      peak = current;
    }
  }
  void Leave() {
    boost::lock_guard<boost::mutex> locker(lock);
    --current;
  }
};

void Hammer(const shared_ptr<ConcurrencyGate> &gate, Occupancy *occupancy,
            unsigned seed, int rounds) {
  for (int i = 0; i < rounds; ++i) {
    seed = seed * 1103515245u + 12345u;
    PermitPtr permit = gate->Acquire();
    occupancy->Enter();
    boost::this_thread::sleep(
        boost::posix_time::microseconds((seed >> 16) % 500));
    occupancy->Leave();
    if ((seed >> 8) % 2 == 0) {
      permit->Release();
    }
    // otherwise released when permit goes out of scope
  }
}

TEST(ConcurrencyGateTest, RandomizedNeverExceedsBudget) {
  static const size_t budget = 4;
  static const int threads = 16;
  shared_ptr<ConcurrencyGate> gate = ConcurrencyGate::Create(budget);
  Occupancy occupancy;

  boost::thread_group group;
  for (int i = 0; i < threads; ++i) {
    group.create_thread(boost::bind(&Hammer, gate, &occupancy,
                                    static_cast<unsigned>(i * 7919 + 1), 50));
  }
  group.join_all();

  EXPECT_LE(occupancy.peak, budget);
  EXPECT_LE(gate->GetPeakInUse(), budget);
  EXPECT_GE(gate->GetPeakInUse(), 1u);
  EXPECT_EQ(gate->GetInUse(), 0u);
}

}  // namespace Threading
}  // namespace QSX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
