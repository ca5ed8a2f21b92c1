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

// Sandboxee binary that runs one script. It is spawned by SandboxExecutor
// through Sandbox2 for exactly one execution, initializes V8, applies the
// sandbox policy and then waits for the ScriptSpec on the comms channel:
//
//   host   -> runner: kRunScript, ScriptSpec
//   runner -> host:   kCapabilityCall, CapabilityCall  (zero or more times)
//   host   -> runner: CapabilityReply                  (one per call)
//
// The script's console output goes to the runner's stdout and stderr; the
// way it ended is the exit code (see RunnerExitCode).

#include <cstdint>
#include <iostream>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sandbox/runner_protocol.h"
#include "sandbox/sandbox_protocol.pb.h"
#include "sandbox/script_engine.h"
#include "sandboxed_api/sandbox2/client.h"
#include "sandboxed_api/sandbox2/comms.h"
#include "util/status_encoding.h"
#include "util/status_macros.h"
#include "v8/v8_platform_initializer.h"

namespace scriptbox::sandbox {
namespace {

using ::scriptbox::util::StatusFromProto;

// Forwards capability calls to the host and waits for each reply.
class CommsCapabilityChannel : public CapabilityChannel {
 public:
  explicit CommsCapabilityChannel(sandbox2::Comms* comms) : comms_(comms) {}

  absl::StatusOr<std::string> Call(absl::string_view import_path,
                                   absl::string_view input_json) override {
    CapabilityCall call;
    call.set_call_id(++last_call_id_);
    call.set_import_path(std::string(import_path));
    call.set_input_json(std::string(input_json));
    if (!comms_->SendTLV(static_cast<uint32_t>(RunnerOp::kCapabilityCall),
                         /*length=*/0,
                         /*value=*/nullptr)) {
      return absl::UnavailableError("SendTLV failed");
    }
    if (!comms_->SendProtoBuf(call)) {
      return absl::UnavailableError("SendProtoBuf failed");
    }
    CapabilityReply reply;
    if (!comms_->RecvProtoBuf(&reply)) {
      return absl::UnavailableError("RecvProtoBuf failed");
    }
    if (reply.call_id() != call.call_id()) {
      return absl::InternalError("Capability reply out of order");
    }
    RETURN_IF_ERROR(StatusFromProto(reply.status()));
    return reply.output_json();
  }

 private:
  sandbox2::Comms* const comms_;
  uint64_t last_call_id_ = 0;
};

// Receives the script to run. Fails when the host sent anything else.
absl::StatusOr<ScriptSpec> ReceiveSpec(sandbox2::Comms& comms) {
  uint32_t tag;
  std::vector<uint8_t> unused;
  if (!comms.RecvTLV(&tag, &unused)) {
    return absl::UnavailableError("RecvTLV failed");
  }
  if (tag != static_cast<uint32_t>(RunnerOp::kRunScript)) {
    return absl::InvalidArgumentError("Unexpected runner operation");
  }
  ScriptSpec spec;
  if (!comms.RecvProtoBuf(&spec)) {
    return absl::UnavailableError("RecvProtoBuf failed");
  }
  return spec;
}

}  // namespace
}  // namespace scriptbox::sandbox

int main(int argc, char** argv) {
  sandbox2::Comms comms(sandbox2::Comms::kSandbox2ClientCommsFD);
  sandbox2::Client client(&comms);

  // V8 starts its worker threads here, before the syscall policy applies.
  scriptbox::v8::V8PlatformInitializer v8_platform_initializer;
  client.SandboxMeHere();

  absl::StatusOr<scriptbox::sandbox::ScriptSpec> spec =
      scriptbox::sandbox::ReceiveSpec(comms);
  if (!spec.ok()) {
    std::cerr << "Runner fault: " << spec.status() << std::endl;
    return scriptbox::sandbox::kRunnerFault;
  }
  scriptbox::sandbox::CommsCapabilityChannel channel(&comms);
  scriptbox::sandbox::ScriptEngine engine(&channel, &std::cout, &std::cerr);
  const scriptbox::sandbox::RunnerExitCode exit_code = engine.Run(*spec);
  std::cout.flush();
  std::cerr.flush();
  return exit_code;
}
