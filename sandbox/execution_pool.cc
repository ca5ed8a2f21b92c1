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

#include <algorithm>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"

namespace scriptbox::sandbox {

ExecutionPool::Slot::~Slot() {
  if (pool_ != nullptr) {
    pool_->Release();
  }
}

ExecutionPool::ExecutionPool(const ExecutionPoolOptions& options)
    : options_(options) {}

absl::StatusOr<ExecutionPool::Slot> ExecutionPool::Acquire(
    absl::Time deadline) {
  absl::MutexLock lock(&mu_);
  if (waiters_.empty() && running_ < options_.max_concurrent) {
    ++running_;
    return Slot(this);
  }
  if (static_cast<int>(waiters_.size()) >= options_.max_queued) {
    spdlog::warn("Execution queue full: {} running, {} waiting", running_,
                 waiters_.size());
    return absl::ResourceExhaustedError(absl::StrCat(
        "Execution queue is full (", waiters_.size(), " waiting)"));
  }

  const uint64_t ticket = next_ticket_++;
  waiters_.push_back(ticket);
  while (waiters_.front() != ticket || running_ >= options_.max_concurrent) {
    if (released_.WaitWithDeadline(&mu_, deadline) &&
        (waiters_.front() != ticket ||
         running_ >= options_.max_concurrent)) {
      waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));
      // The next waiter may have become the head of the queue.
      released_.SignalAll();
      return absl::DeadlineExceededError(
          "Deadline passed while waiting for an execution slot");
    }
  }
  waiters_.pop_front();
  ++running_;
  // A second free slot may admit the next waiter too.
  released_.SignalAll();
  return Slot(this);
}

void ExecutionPool::Release() {
  absl::MutexLock lock(&mu_);
  --running_;
  released_.SignalAll();
}

int ExecutionPool::running() const {
  absl::MutexLock lock(&mu_);
  return running_;
}

int ExecutionPool::queued() const {
  absl::MutexLock lock(&mu_);
  return waiters_.size();
}

}  // namespace scriptbox::sandbox
