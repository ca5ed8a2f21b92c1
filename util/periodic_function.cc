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

#include "util/periodic_function.h"

#include <utility>

namespace scriptbox::util {

PeriodicFunction::PeriodicFunction(std::function<void()> function,
                                   absl::Duration first_invocation_delay,
                                   absl::Duration invocation_interval)
    : function_(std::move(function)),
      thread_(&PeriodicFunction::Loop, this, first_invocation_delay,
              invocation_interval) {}

PeriodicFunction::~PeriodicFunction() {
  stop_.Notify();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PeriodicFunction::Loop(absl::Duration first_invocation_delay,
                            absl::Duration invocation_interval) {
  absl::Duration wait = first_invocation_delay;
  while (!stop_.WaitForNotificationWithTimeout(wait)) {
    function_();
    wait = invocation_interval;
  }
}

PeriodicFunctionFactory PeriodicFunction::DefaultFactory() {
  return [](std::function<void()> function,
            absl::Duration first_invocation_delay,
            absl::Duration invocation_interval) {
    return std::make_unique<PeriodicFunction>(
        std::move(function), first_invocation_delay, invocation_interval);
  };
}

}  // namespace scriptbox::util
