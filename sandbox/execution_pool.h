/*
 * Copyright 2021 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SANDBOX_EXECUTION_POOL_H_
#define SANDBOX_EXECUTION_POOL_H_

#include <cstdint>
#include <deque>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace scriptbox::sandbox {

struct ExecutionPoolOptions {
  // Children allowed to run at the same time.
  int max_concurrent = 4;
  // Requests allowed to wait for a slot; further requests are refused.
  int max_queued = 16;
};

// Bounds the number of concurrently running sandboxes. Waiters are admitted
// strictly in arrival order.
class ExecutionPool {
 public:
  // Held for the duration of one execution; returns the slot when destroyed.
  class Slot {
   public:
    Slot(Slot&& other) : pool_(other.pool_) { other.pool_ = nullptr; }
    Slot& operator=(Slot&&) = delete;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot();

   private:
    friend class ExecutionPool;
    explicit Slot(ExecutionPool* pool) : pool_(pool) {}

    ExecutionPool* pool_;
  };

  explicit ExecutionPool(const ExecutionPoolOptions& options);

  ExecutionPool(const ExecutionPool&) = delete;
  ExecutionPool& operator=(const ExecutionPool&) = delete;

  // Blocks until a slot is free and every earlier waiter was admitted.
  // Returns ResourceExhausted right away when the queue is full and
  // DeadlineExceeded when `deadline` passes while waiting.
  absl::StatusOr<Slot> Acquire(absl::Time deadline) ABSL_LOCKS_EXCLUDED(mu_);

  int running() const ABSL_LOCKS_EXCLUDED(mu_);
  int queued() const ABSL_LOCKS_EXCLUDED(mu_);

 private:
  void Release() ABSL_LOCKS_EXCLUDED(mu_);

  const ExecutionPoolOptions options_;
  mutable absl::Mutex mu_;
  absl::CondVar released_;
  int running_ ABSL_GUARDED_BY(mu_) = 0;
  // Tickets of the waiting requests, oldest first.
  std::deque<uint64_t> waiters_ ABSL_GUARDED_BY(mu_);
  uint64_t next_ticket_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_EXECUTION_POOL_H_
