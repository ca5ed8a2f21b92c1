// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "sandbox/execution_pool.h"

#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scriptbox::sandbox {
namespace {

using ::testing::ElementsAre;

absl::Time Far() { return absl::Now() + absl::Seconds(30); }

void WaitForQueued(const ExecutionPool& pool, int queued) {
  while (pool.queued() != queued) {
    absl::SleepFor(absl::Milliseconds(1));
  }
}

TEST(ExecutionPoolTest, AdmitsUpToMaxConcurrent) {
  ExecutionPool pool(ExecutionPoolOptions{.max_concurrent = 2,
                                          .max_queued = 0});
  auto first = pool.Acquire(Far());
  auto second = pool.Acquire(Far());
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(pool.running(), 2);

  auto third = pool.Acquire(Far());
  EXPECT_EQ(third.status().code(), absl::StatusCode::kResourceExhausted);
}

TEST(ExecutionPoolTest, ReleasingASlotFreesCapacity) {
  ExecutionPool pool(ExecutionPoolOptions{.max_concurrent = 1,
                                          .max_queued = 0});
  {
    auto slot = pool.Acquire(Far());
    ASSERT_TRUE(slot.ok());
  }
  EXPECT_EQ(pool.running(), 0);
  EXPECT_TRUE(pool.Acquire(Far()).ok());
}

TEST(ExecutionPoolTest, WaiterLeavesQueueAtDeadline) {
  ExecutionPool pool(ExecutionPoolOptions{.max_concurrent = 1,
                                          .max_queued = 4});
  auto held = pool.Acquire(Far());
  ASSERT_TRUE(held.ok());
  auto waiter = pool.Acquire(absl::Now() + absl::Milliseconds(50));
  EXPECT_EQ(waiter.status().code(), absl::StatusCode::kDeadlineExceeded);
  EXPECT_EQ(pool.queued(), 0);
  EXPECT_EQ(pool.running(), 1);
}

TEST(ExecutionPoolTest, AdmitsWaitersInArrivalOrder) {
  ExecutionPool pool(ExecutionPoolOptions{.max_concurrent = 1,
                                          .max_queued = 4});
  absl::Mutex mu;
  std::vector<std::string> order;
  auto run = [&](std::string name) {
    auto slot = pool.Acquire(Far());
    ASSERT_TRUE(slot.ok());
    absl::MutexLock lock(&mu);
    order.push_back(name);
  };

  std::optional<absl::StatusOr<ExecutionPool::Slot>> held(pool.Acquire(Far()));
  ASSERT_TRUE(held->ok());
  std::thread first(run, "first");
  WaitForQueued(pool, 1);
  std::thread second(run, "second");
  WaitForQueued(pool, 2);
  std::thread third(run, "third");
  WaitForQueued(pool, 3);

  held.reset();
  first.join();
  second.join();
  third.join();
  EXPECT_THAT(order, ElementsAre("first", "second", "third"));
  EXPECT_EQ(pool.running(), 0);
}

}  // namespace
}  // namespace scriptbox::sandbox
