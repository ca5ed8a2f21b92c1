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

#ifndef SANDBOX_RUNNER_PROTOCOL_H_
#define SANDBOX_RUNNER_PROTOCOL_H_

#include <cstdint>

namespace scriptbox::sandbox {

// Tags of the TLV messages exchanged with the script runner. Each tag is
// followed by one protobuf message on the same comms channel.
enum class RunnerOp : uint32_t {
  // Host -> runner, followed by ScriptSpec. Sent exactly once.
  kRunScript = 0x2001,
  // Runner -> host, followed by CapabilityCall. The host answers with a
  // CapabilityReply.
  kCapabilityCall = 0x2002,
};

// Exit codes of the script runner.
enum RunnerExitCode {
  kRunnerSuccess = 0,
  // The script threw, rejected or never settled.
  kRunnerScriptError = 1,
  // The runner itself failed, e.g. a broken comms channel.
  kRunnerFault = 2,
  // The V8 heap limit was reached.
  kRunnerOutOfMemory = 3,
};

// Mount point of the scratch directory inside the sandbox.
inline constexpr char kSandboxScratchDir[] = "/scratch";

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_RUNNER_PROTOCOL_H_
