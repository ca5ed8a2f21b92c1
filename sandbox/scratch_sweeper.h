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

#ifndef SANDBOX_SCRATCH_SWEEPER_H_
#define SANDBOX_SCRATCH_SWEEPER_H_

#include <memory>
#include <string>

#include "absl/time/time.h"
#include "util/periodic_function.h"

namespace scriptbox::sandbox {

// Periodically removes execution scratch directories
// (<scratch_root>/<tenant>/<execution id>) last modified more than
// `max_age` ago. Executions remove their own directory; this only catches
// what a crashed host left behind.
class ScratchSweeper {
 public:
  ScratchSweeper(
      std::string scratch_root, absl::Duration max_age,
      absl::Duration interval,
      const util::PeriodicFunctionFactory& periodic_function_factory =
          util::PeriodicFunction::DefaultFactory());

  // Removes every expired directory as of `now`; returns how many were
  // removed.
  int SweepOnce(absl::Time now) const;

  ScratchSweeper(const ScratchSweeper&) = delete;
  ScratchSweeper& operator=(const ScratchSweeper&) = delete;

 private:
  const std::string scratch_root_;
  const absl::Duration max_age_;
  std::unique_ptr<util::PeriodicFunction> periodic_sweep_;
};

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_SCRATCH_SWEEPER_H_
