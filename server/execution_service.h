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

#ifndef SERVER_EXECUTION_SERVICE_H_
#define SERVER_EXECUTION_SERVICE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "capability/capability_discovery.h"
#include "capability/capability_registry.h"
#include "context/execution_context.h"
#include "google/protobuf/repeated_field.h"
#include "proto/scriptbox.pb.h"
#include "result/result_collector.h"
#include "sandbox/execution_pool.h"
#include "sandbox/script_executor_interface.h"
#include "validator/script_validator.h"

namespace scriptbox::server {

struct ExecutionServiceOptions {
  context::ExecutionContextOptions context;
  validator::ValidatorOptions validator;
  sandbox::ExecutionPoolOptions pool;
  result::ResultOptions result;
};

// Runs one request end to end: context build, static validation, admission
// to the execution pool, sandboxed execution and result collection. Safe to
// call from many threads at once.
class ExecutionService {
 public:
  // `registry` must outlive the service. `secrets` are redacted from every
  // result.
  ExecutionService(const ExecutionServiceOptions& options,
                   const capability::CapabilityRegistry* registry,
                   std::unique_ptr<sandbox::ScriptExecutorInterface> executor,
                   std::vector<std::string> secrets);

  // Never fails: every problem, including an unexpected exception, is
  // reported as a status of the returned result.
  ExecutionResult Execute(const ExecutionRequest& request) const;

  // Runs only the static validator.
  ValidationResult Validate(const ValidateCodeRequest& request) const;

  const capability::CapabilityDiscovery& discovery() const {
    return discovery_;
  }

  ExecutionService(const ExecutionService&) = delete;
  ExecutionService& operator=(const ExecutionService&) = delete;

 private:
  ExecutionResult Run(const ExecutionRequest& request,
                      absl::Time submitted_at) const;

  // Capabilities a script may import: the whole registry, narrowed to
  // `declared` when that is non-empty.
  absl::flat_hash_set<std::string> AllowedCapabilities(
      const google::protobuf::RepeatedPtrField<std::string>& declared) const;

  const capability::CapabilityRegistry* const registry_;
  const capability::CapabilityDiscovery discovery_;
  const context::ExecutionContextBuilder context_builder_;
  const validator::ScriptValidator validator_;
  mutable sandbox::ExecutionPool pool_;
  const std::unique_ptr<sandbox::ScriptExecutorInterface> executor_;
  const result::ResultCollector collector_;
};

}  // namespace scriptbox::server

#endif  // SERVER_EXECUTION_SERVICE_H_
