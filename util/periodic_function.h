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

#ifndef UTIL_PERIODIC_FUNCTION_H_
#define UTIL_PERIODIC_FUNCTION_H_

#include <functional>
#include <memory>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace scriptbox::util {

class PeriodicFunction;

// Creates a PeriodicFunction from (callback, first delay, interval). Injected
// into owners so tests can substitute a manually triggered implementation.
using PeriodicFunctionFactory = std::function<std::unique_ptr<PeriodicFunction>(
    std::function<void()>, absl::Duration, absl::Duration)>;

// Runs a callback on a background thread, first after `first_invocation_delay`
// and then every `invocation_interval`, measured from the end of one run to
// the start of the next. Destruction stops the thread without waiting for a
// pending interval to elapse.
class PeriodicFunction {
 public:
  PeriodicFunction(std::function<void()> function,
                   absl::Duration first_invocation_delay,
                   absl::Duration invocation_interval);
  virtual ~PeriodicFunction();

  static PeriodicFunctionFactory DefaultFactory();

  PeriodicFunction(const PeriodicFunction&) = delete;
  PeriodicFunction& operator=(const PeriodicFunction&) = delete;

 protected:
  const std::function<void()> function_;

 private:
  void Loop(absl::Duration first_invocation_delay,
            absl::Duration invocation_interval);

  absl::Notification stop_;
  std::thread thread_;
};

}  // namespace scriptbox::util

#endif  // UTIL_PERIODIC_FUNCTION_H_
