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

#ifndef SANDBOX_CAPABILITY_CALL_HANDLER_H_
#define SANDBOX_CAPABILITY_CALL_HANDLER_H_

#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/types/span.h"
#include "capability/capability_registry.h"
#include "context/execution_context.h"
#include "sandbox/sandbox_protocol.pb.h"

namespace scriptbox::sandbox {

// Host side of the capability channel for one execution. Answers the
// runner's calls through the registry with the host-held context, so that
// tenant identity and credentials never enter the sandbox.
class CapabilityCallHandler {
 public:
  // `imports` are the canonical paths the validated script imports; calls
  // to anything else are refused.
  CapabilityCallHandler(const capability::CapabilityRegistry* registry,
                        absl::Span<const std::string> imports,
                        const context::ExecutionContext* context);

  CapabilityReply Handle(const CapabilityCall& call) const;

 private:
  const capability::CapabilityRegistry* const registry_;
  const absl::flat_hash_set<std::string> imports_;
  const context::ExecutionContext* const context_;
};

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_CAPABILITY_CALL_HANDLER_H_
