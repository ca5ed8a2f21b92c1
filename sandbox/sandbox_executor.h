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

#ifndef SANDBOX_SANDBOX_EXECUTOR_H_
#define SANDBOX_SANDBOX_EXECUTOR_H_

#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "capability/capability_registry.h"
#include "sandbox/sandbox_protocol.pb.h"
#include "sandbox/script_executor_interface.h"
#include "sandboxed_api/sandbox2/comms.h"
#include "sandboxed_api/sandbox2/policy.h"
#include "sandboxed_api/sandbox2/result.h"

namespace scriptbox::sandbox {

struct SandboxOptions {
  // Path of the script_runner binary.
  std::string runner_path;
  // Memory ceiling of each script. Half of it is given to the V8 heap, the
  // rest is headroom for the runner itself. The address space is unlimited.
  size_t memory_limit_bytes = 512 * 1024 * 1024;
  // Cap for each of stdout and stderr.
  size_t capture_limit_bytes = 1024 * 1024;
};

// Runs each script in its own freshly spawned Sandbox2 child (the
// script_runner binary): private mount namespace holding only the runner,
// its libraries and the execution's scratch directory, no network
// interfaces, an empty environment, a seccomp allow-list and rlimits. The
// child is never reused. Capability calls from the child are answered
// through the registry while it runs.
class SandboxExecutor : public ScriptExecutorInterface {
 public:
  // `registry` must outlive the executor.
  SandboxExecutor(SandboxOptions options,
                  const capability::CapabilityRegistry* registry);

  RawExecutionOutcome Execute(
      absl::string_view source, absl::Span<const std::string> imports,
      const context::ExecutionContext& context) const override;

  SandboxExecutor(const SandboxExecutor&) = delete;
  SandboxExecutor& operator=(const SandboxExecutor&) = delete;

 private:
  absl::StatusOr<std::unique_ptr<sandbox2::Policy>> BuildPolicy(
      const std::string& scratch_dir) const;

  // Runs the spawned child to completion. Returns once the child has closed
  // the comms channel, i.e. exited or been killed.
  void Supervise(sandbox2::Comms* comms, const ScriptSpec& spec,
                 absl::Span<const std::string> imports,
                 const context::ExecutionContext& context,
                 RawExecutionOutcome* outcome) const;

  const SandboxOptions options_;
  const capability::CapabilityRegistry* const registry_;
};

// Maps how Sandbox2 saw the child end onto an outcome state. Sets `state`,
// `exit_code` and `detail` of `outcome`.
void ClassifyResult(const sandbox2::Result& result,
                    RawExecutionOutcome* outcome);

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_SANDBOX_EXECUTOR_H_
