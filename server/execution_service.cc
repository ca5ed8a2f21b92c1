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

#include "server/execution_service.h"

#include <exception>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "absl/time/clock.h"
#include "capability/import_path.h"
#include "spdlog/spdlog.h"

namespace scriptbox::server {

namespace {

ExecutionResult Failure(ExecutionResult::Status status,
                        std::string diagnostic) {
  ExecutionResult result;
  result.set_status(status);
  result.add_diagnostics(std::move(diagnostic));
  return result;
}

}  // namespace

ExecutionService::ExecutionService(
    const ExecutionServiceOptions& options,
    const capability::CapabilityRegistry* registry,
    std::unique_ptr<sandbox::ScriptExecutorInterface> executor,
    std::vector<std::string> secrets)
    : registry_(registry),
      discovery_(*registry),
      context_builder_(options.context),
      validator_(options.validator),
      pool_(options.pool),
      executor_(std::move(executor)),
      collector_(options.result, std::move(secrets)) {}

ExecutionResult ExecutionService::Execute(
    const ExecutionRequest& request) const {
  const absl::Time submitted_at = absl::Now();
  ExecutionResult result;
  try {
    result = Run(request, submitted_at);
  } catch (const std::exception& e) {
    spdlog::error("Unexpected failure while executing a script for tenant "
                  "{}: {}",
                  request.tenant_id(), collector_.Redact(e.what()));
    result = Failure(ExecutionResult::INTERNAL_ERROR,
                     "Internal error while executing the script.");
  }
  result.set_duration_ms(
      absl::ToInt64Milliseconds(absl::Now() - submitted_at));
  return result;
}

ExecutionResult ExecutionService::Run(const ExecutionRequest& request,
                                      absl::Time submitted_at) const {
  absl::StatusOr<context::ExecutionContext> context = context_builder_.Build(
      request.tenant_id(), request.domain(), request.credential_handle(),
      request.time_budget_ms(), submitted_at);
  if (!context.ok()) {
    spdlog::info("Rejected execution request: {}",
                 std::string(context.status().message()));
    return Failure(ExecutionResult::VALIDATION_FAILED,
                   std::string(context.status().message()));
  }

  ExecutionResult result;
  result.set_execution_id(context->execution_id());
  for (const auto& diagnostic : context->diagnostics()) {
    result.add_diagnostics(collector_.Redact(diagnostic));
  }

  const ValidationResult validation = validator_.Validate(
      request.source_code(),
      AllowedCapabilities(request.declared_capabilities()));
  const std::vector<std::string> imports(validation.imports().begin(),
                                         validation.imports().end());
  for (auto& descriptor : discovery_.DescribeImports(imports)) {
    *result.add_capabilities_used() = std::move(descriptor);
  }
  if (!validation.ok()) {
    result.set_status(ExecutionResult::VALIDATION_FAILED);
    result.set_validation_stage(validation.stage());
    for (const auto& diagnostic : validation.diagnostics()) {
      result.add_diagnostics(collector_.Redact(diagnostic));
    }
    return result;
  }

  absl::StatusOr<sandbox::ExecutionPool::Slot> slot =
      pool_.Acquire(context->deadline());
  if (!slot.ok()) {
    switch (slot.status().code()) {
      case absl::StatusCode::kResourceExhausted:
        spdlog::error("Execution {} refused: {}", context->execution_id(),
                      std::string(slot.status().message()));
        result.set_status(ExecutionResult::INTERNAL_ERROR);
        result.add_diagnostics(
            "Execution service overloaded; retry the request later.");
        break;
      case absl::StatusCode::kDeadlineExceeded:
        result.set_status(ExecutionResult::TIMEOUT);
        result.add_diagnostics(absl::Substitute(
            "Time budget of $0 ms elapsed while waiting for an execution "
            "slot.",
            absl::ToInt64Milliseconds(context->time_budget())));
        break;
      default:
        spdlog::error("Execution {} could not be admitted: {}",
                      context->execution_id(), slot.status().ToString());
        result.set_status(ExecutionResult::INTERNAL_ERROR);
        result.add_diagnostics("Internal error while scheduling the script.");
        break;
    }
    return result;
  }

  const sandbox::RawExecutionOutcome outcome =
      executor_->Execute(request.source_code(), imports, *context);
  ExecutionResult collected = collector_.Collect(outcome);
  result.set_status(collected.status());
  if (collected.has_output()) {
    *result.mutable_output() = std::move(*collected.mutable_output());
  }
  result.set_stderr_excerpt(std::move(*collected.mutable_stderr_excerpt()));
  for (auto& diagnostic : *collected.mutable_diagnostics()) {
    result.add_diagnostics(std::move(diagnostic));
  }

  if (result.status() == ExecutionResult::INTERNAL_ERROR) {
    spdlog::error("Execution {} ended {}: {}", context->execution_id(),
                  std::string(sandbox::StateName(outcome.state)),
                  collector_.Redact(outcome.detail));
  } else {
    spdlog::info("Execution {} for tenant {} finished with {} after {} "
                 "capability call(s)",
                 context->execution_id(), context->tenant_id(),
                 ExecutionResult::Status_Name(result.status()),
                 outcome.capability_calls);
  }
  return result;
}

ValidationResult ExecutionService::Validate(
    const ValidateCodeRequest& request) const {
  ValidationResult validation = validator_.Validate(
      request.source_code(),
      AllowedCapabilities(request.declared_capabilities()));
  for (auto& diagnostic : *validation.mutable_diagnostics()) {
    diagnostic = collector_.Redact(diagnostic);
  }
  return validation;
}

absl::flat_hash_set<std::string> ExecutionService::AllowedCapabilities(
    const google::protobuf::RepeatedPtrField<std::string>& declared) const {
  absl::flat_hash_set<std::string> declared_paths;
  for (const auto& specifier : declared) {
    declared_paths.insert(capability::CanonicalImportPath(specifier));
  }
  absl::flat_hash_set<std::string> allowed;
  for (const auto* descriptor : registry_->List()) {
    if (declared_paths.empty() ||
        declared_paths.contains(descriptor->import_path())) {
      allowed.insert(descriptor->import_path());
    }
  }
  return allowed;
}

}  // namespace scriptbox::server
