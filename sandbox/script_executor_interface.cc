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

#include "sandbox/script_executor_interface.h"

namespace scriptbox {
namespace sandbox {

absl::string_view StateName(RawExecutionOutcome::State state) {
  switch (state) {
    case RawExecutionOutcome::State::kCompleted:
      return "completed";
    case RawExecutionOutcome::State::kTimedOut:
      return "timed_out";
    case RawExecutionOutcome::State::kKilledOom:
      return "killed_oom";
    case RawExecutionOutcome::State::kCrashed:
      return "crashed";
    case RawExecutionOutcome::State::kSpawnFailed:
      return "spawn_failed";
  }
  return "unknown";
}

}  // namespace sandbox
}  // namespace scriptbox
