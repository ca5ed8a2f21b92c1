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

#ifndef SANDBOX_SCRIPT_EXECUTOR_INTERFACE_H_
#define SANDBOX_SCRIPT_EXECUTOR_INTERFACE_H_

#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "context/execution_context.h"

namespace scriptbox {
namespace sandbox {

// What happened to one sandboxed run, before any interpretation of the
// script's output.
struct RawExecutionOutcome {
  enum class State {
    // The runner exited on its own; see `exit_code`.
    kCompleted,
    // Killed at the wall-time limit.
    kTimedOut,
    // Exceeded the memory ceiling or another resource limit.
    kKilledOom,
    // Killed by a signal or policy violation, or the runner faulted.
    kCrashed,
    // The child could not be set up.
    kSpawnFailed,
  };

  State state = State::kSpawnFailed;
  // Runner exit code. Meaningful for kCompleted only.
  int exit_code = -1;
  // Captured output, at most the capture limit each.
  std::string stdout_bytes;
  std::string stderr_bytes;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  absl::Duration wall_time;
  int capability_calls = 0;
  // Human-readable detail for the non-completed states.
  std::string detail;
};

absl::string_view StateName(RawExecutionOutcome::State state);

// Runs validated scripts to completion.
class ScriptExecutorInterface {
 public:
  virtual ~ScriptExecutorInterface() = default;

  // Runs `source`, which imports exactly the canonical paths in `imports`,
  // on behalf of `context`. Must not outlive `context.deadline()`. Blocks
  // until the run has ended; never fails, every problem is a state of the
  // returned outcome.
  virtual RawExecutionOutcome Execute(
      absl::string_view source, absl::Span<const std::string> imports,
      const context::ExecutionContext& context) const = 0;
};

}  // namespace sandbox
}  // namespace scriptbox

#endif  // SANDBOX_SCRIPT_EXECUTOR_INTERFACE_H_
