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

#include "sandbox/sandbox_executor.h"

#include <asm/unistd_64.h>
#include <linux/futex.h>
#include <linux/prctl.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/resource.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "capability/import_path.h"
#include "sandbox/capability_call_handler.h"
#include "sandbox/runner_protocol.h"
#include "sandboxed_api/sandbox2/executor.h"
#include "sandboxed_api/sandbox2/limits.h"
#include "sandboxed_api/sandbox2/policybuilder.h"
#include "sandboxed_api/sandbox2/sandbox2.h"
#include "sandboxed_api/sandbox2/util/bpf_helper.h"
#include "sandboxed_api/util/fileops.h"
#include "spdlog/spdlog.h"

namespace scriptbox::sandbox {
namespace {

using ::sapi::file_util::fileops::FDCloser;

absl::StatusOr<int> NewCaptureFile(const char* name) {
  const int fd = memfd_create(name, MFD_CLOEXEC);
  if (fd < 0) {
    return absl::InternalError(absl::StrCat("memfd_create failed: errno ",
                                            errno));
  }
  return fd;
}

// Reads up to `limit` bytes from the start of `fd`.
std::string ReadCapture(int fd, size_t limit, bool* truncated) {
  std::string contents;
  *truncated = false;
  if (lseek(fd, 0, SEEK_SET) < 0) {
    return contents;
  }
  char buffer[8192];
  while (contents.size() < limit) {
    const ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n <= 0) {
      return contents;
    }
    contents.append(buffer, static_cast<size_t>(n));
  }
  if (contents.size() > limit) {
    contents.resize(limit);
    *truncated = true;
  } else {
    *truncated = read(fd, buffer, 1) > 0;
  }
  return contents;
}

// Bindings for every capability the script imports; runtime modules need
// none.
ScriptSpec NewScriptSpec(absl::string_view source,
                         absl::Span<const std::string> imports,
                         const capability::CapabilityRegistry& registry,
                         size_t heap_limit_bytes) {
  ScriptSpec spec;
  spec.set_source_code(std::string(source));
  spec.set_scratch_dir(kSandboxScratchDir);
  spec.set_heap_limit_bytes(heap_limit_bytes);
  for (const std::string& import_path : imports) {
    absl::StatusOr<const CapabilityDescriptor*> descriptor =
        registry.Resolve(import_path);
    if (!descriptor.ok()) {
      continue;
    }
    auto* binding = spec.add_capabilities();
    binding->set_import_path((*descriptor)->import_path());
    binding->set_export_name((*descriptor)->name());
  }
  return spec;
}

}  // namespace

void ClassifyResult(const sandbox2::Result& result,
                    RawExecutionOutcome* outcome) {
  using State = RawExecutionOutcome::State;
  const int reason = static_cast<int>(result.reason_code());
  switch (result.final_status()) {
    case sandbox2::Result::OK:
      outcome->exit_code = reason;
      if (reason == kRunnerOutOfMemory) {
        outcome->state = State::kKilledOom;
        outcome->detail = "Script exceeded the memory limit";
      } else if (reason == kRunnerFault) {
        outcome->state = State::kCrashed;
        outcome->detail = "Script runner fault";
      } else {
        outcome->state = State::kCompleted;
      }
      return;
    case sandbox2::Result::TIMEOUT:
      outcome->state = State::kTimedOut;
      outcome->detail = "Script exceeded its time budget";
      return;
    case sandbox2::Result::SIGNALED:
      if (reason == SIGXCPU || reason == SIGXFSZ) {
        outcome->state = State::kKilledOom;
        outcome->detail = reason == SIGXCPU
                              ? "Script exceeded the CPU time limit"
                              : "Script exceeded the output size limit";
        return;
      }
      outcome->state = State::kCrashed;
      outcome->detail = absl::StrCat("Script runner killed by signal ", reason);
      return;
    case sandbox2::Result::SETUP_ERROR:
      outcome->state = State::kSpawnFailed;
      outcome->detail = result.ToString();
      return;
    default:
      // Policy violations, external kills and monitor errors.
      outcome->state = State::kCrashed;
      outcome->detail = result.ToString();
      return;
  }
}

SandboxExecutor::SandboxExecutor(SandboxOptions options,
                                 const capability::CapabilityRegistry* registry)
    : options_(std::move(options)), registry_(registry) {}

// The minimum V8 needs to evaluate a module single-threaded, plus file
// access below the mounted scratch directory.
absl::StatusOr<std::unique_ptr<sandbox2::Policy>> SandboxExecutor::BuildPolicy(
    const std::string& scratch_dir) const {
  return sandbox2::PolicyBuilder()
      .AllowDynamicStartup()
      .AllowRead()
      .AllowWrite()
      .AllowOpen()
      .AllowStat()
      .AllowMmap()
      .AllowTCGETS()
      .AllowGetPIDs()
      .AllowGetRandom()
      .AllowTime()
      .AllowHandleSignals()
      .AllowExit()
      .AllowFutexOp(FUTEX_WAIT)
      .AllowFutexOp(FUTEX_WAKE)
      .AddPolicyOnSyscall(__NR_prctl,
                          {
                              ARG_32(0),
                              JEQ32(PR_SET_NAME, ALLOW),
                              KILL,
                          })
      .AllowSyscalls({
          // Allows to mark pages as executable, which is necessary for the
          // V8 JIT.
          __NR_mprotect,
          __NR_madvise,
          __NR_set_robust_list,
          __NR_sched_yield,
          __NR_sched_getaffinity,
          __NR_clone,
          __NR_getdents64,
          __NR_lseek,
          __NR_ftruncate,
          __NR_sysinfo,
          __NR_getrusage,
      })
      .AddLibrariesForBinary(options_.runner_path)
      .AddDirectoryAt(scratch_dir, kSandboxScratchDir, /*is_ro=*/false)
      .TryBuild();
}

void SandboxExecutor::Supervise(sandbox2::Comms* comms, const ScriptSpec& spec,
                                absl::Span<const std::string> imports,
                                const context::ExecutionContext& context,
                                RawExecutionOutcome* outcome) const {
  if (!comms->SendTLV(static_cast<uint32_t>(RunnerOp::kRunScript),
                      /*length=*/0,
                      /*value=*/nullptr) ||
      !comms->SendProtoBuf(spec)) {
    spdlog::warn("Unable to send the script to runner for execution {}",
                 context.execution_id());
    return;
  }
  const CapabilityCallHandler handler(registry_, imports, &context);
  while (true) {
    uint32_t tag;
    std::vector<uint8_t> unused;
    if (!comms->RecvTLV(&tag, &unused)) {
      // The runner exited or was killed.
      return;
    }
    if (tag != static_cast<uint32_t>(RunnerOp::kCapabilityCall)) {
      spdlog::warn("Unexpected message {:#x} from runner for execution {}",
                   tag, context.execution_id());
      return;
    }
    CapabilityCall call;
    if (!comms->RecvProtoBuf(&call)) {
      return;
    }
    ++outcome->capability_calls;
    const CapabilityReply reply = handler.Handle(call);
    if (reply.status().code() ==
        static_cast<int>(absl::StatusCode::kDeadlineExceeded)) {
      // Left unanswered, the runner is stopped by the wall-time limit.
      spdlog::debug("Execution {}: deadline reached during {}",
                    context.execution_id(), call.import_path());
      return;
    }
    if (!comms->SendProtoBuf(reply)) {
      return;
    }
  }
}

RawExecutionOutcome SandboxExecutor::Execute(
    absl::string_view source, absl::Span<const std::string> imports,
    const context::ExecutionContext& context) const {
  using State = RawExecutionOutcome::State;
  RawExecutionOutcome outcome;
  const absl::Time started = absl::Now();
  const std::string& scratch_dir = context.scratch_dir();

  if (!sapi::file_util::fileops::CreateDirectoryRecursively(scratch_dir,
                                                            0700)) {
    outcome.state = State::kSpawnFailed;
    outcome.detail = "Unable to create the scratch directory";
    spdlog::error("Unable to create scratch directory {}", scratch_dir);
    return outcome;
  }
  absl::Cleanup remove_scratch = [&scratch_dir] {
    if (!sapi::file_util::fileops::DeleteRecursively(scratch_dir)) {
      spdlog::warn("Unable to remove scratch directory {}", scratch_dir);
    }
  };

  const absl::Duration remaining = context.TimeRemaining(started);
  if (remaining <= absl::ZeroDuration()) {
    outcome.state = State::kTimedOut;
    outcome.detail = "Deadline passed before the script could start";
    return outcome;
  }

  absl::StatusOr<int> stdout_fd = NewCaptureFile("scriptbox-stdout");
  absl::StatusOr<int> stderr_fd = NewCaptureFile("scriptbox-stderr");
  if (!stdout_fd.ok() || !stderr_fd.ok()) {
    if (stdout_fd.ok()) close(*stdout_fd);
    if (stderr_fd.ok()) close(*stderr_fd);
    outcome.state = State::kSpawnFailed;
    outcome.detail = "Unable to create capture files";
    return outcome;
  }
  FDCloser stdout_closer(*stdout_fd);
  FDCloser stderr_closer(*stderr_fd);

  absl::StatusOr<std::unique_ptr<sandbox2::Policy>> policy =
      BuildPolicy(scratch_dir);
  if (!policy.ok()) {
    outcome.state = State::kSpawnFailed;
    outcome.detail = std::string(policy.status().message());
    spdlog::error("Unable to build sandbox policy: {}",
                  policy.status().ToString());
    return outcome;
  }

  // Empty environment; argv[0] only.
  auto executor = std::make_unique<sandbox2::Executor>(
      options_.runner_path, std::vector<std::string>{options_.runner_path},
      std::vector<std::string>{});
  // The runner sandboxes itself once V8 is initialized.
  executor->set_enable_sandbox_before_exec(false);
  executor->limits()
      // V8 reserves far more address space than it commits (pointer cage,
      // code range), so the heap limit below is the memory ceiling.
      ->set_rlimit_as(RLIM64_INFINITY)
      .set_rlimit_cpu(static_cast<uint64_t>(
          std::ceil(absl::ToDoubleSeconds(context.time_budget()))) + 1)
      .set_rlimit_fsize(options_.capture_limit_bytes)
      .set_rlimit_core(0)
      .set_walltime_limit(remaining);
  // The IPC layer takes ownership of the mapped descriptors.
  executor->ipc()->MapFd(dup(*stdout_fd), STDOUT_FILENO);
  executor->ipc()->MapFd(dup(*stderr_fd), STDERR_FILENO);

  const ScriptSpec spec = NewScriptSpec(source, imports, *registry_,
                                        options_.memory_limit_bytes / 2);
  sandbox2::Sandbox2 sandbox(std::move(executor), *std::move(policy));
  spdlog::debug("Execution {}: spawning", context.execution_id());
  if (sandbox.RunAsync()) {
    spdlog::debug("Execution {}: running", context.execution_id());
    Supervise(sandbox.comms(), spec, imports, context, &outcome);
  }
  const sandbox2::Result result = sandbox.AwaitResult();
  outcome.wall_time = absl::Now() - started;
  ClassifyResult(result, &outcome);

  outcome.stdout_bytes = ReadCapture(
      *stdout_fd, options_.capture_limit_bytes, &outcome.stdout_truncated);
  outcome.stderr_bytes = ReadCapture(
      *stderr_fd, options_.capture_limit_bytes, &outcome.stderr_truncated);
  spdlog::debug("Execution {}: {} after {}", context.execution_id(),
                StateName(outcome.state),
                absl::FormatDuration(outcome.wall_time));
  return outcome;
}

}  // namespace scriptbox::sandbox
