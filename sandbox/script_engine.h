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

#ifndef SANDBOX_SCRIPT_ENGINE_H_
#define SANDBOX_SCRIPT_ENGINE_H_

#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sandbox/runner_protocol.h"
#include "sandbox/sandbox_protocol.pb.h"

namespace scriptbox::sandbox {

// The script's only way out of the sandbox. Implemented over the Sandbox2
// comms channel in the runner and by fakes in tests.
class CapabilityChannel {
 public:
  virtual ~CapabilityChannel() = default;

  // Invokes the capability at canonical `import_path` with a JSON-encoded
  // argument and returns the JSON-encoded result. Blocks until the host
  // replies.
  virtual absl::StatusOr<std::string> Call(absl::string_view import_path,
                                           absl::string_view input_json) = 0;
};

// Evaluates a single script module with V8. Imports resolve to synthetic
// modules whose exported async functions forward to the CapabilityChannel,
// to the embedded std/* modules, or to the native sandbox/scratch module.
// `console.log` and `console.info` write lines to `out`; `console.error`,
// `console.warn` and uncaught errors go to `err`.
//
// V8 must have been initialized (see V8PlatformInitializer).
class ScriptEngine {
 public:
  ScriptEngine(CapabilityChannel* channel, std::ostream* out,
               std::ostream* err);

  ScriptEngine(const ScriptEngine&) = delete;
  ScriptEngine& operator=(const ScriptEngine&) = delete;

  // Runs the module to completion, including top-level await, and returns
  // the runner exit code describing how it ended.
  RunnerExitCode Run(const ScriptSpec& spec);

 private:
  CapabilityChannel* const channel_;
  std::ostream* const out_;
  std::ostream* const err_;
};

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_SCRIPT_ENGINE_H_
