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

#include "capability/capability_registry.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "capability/capability_catalog.h"
#include "capability/import_path.h"
#include "capability/schema_validator.h"
#include "util/status_macros.h"

namespace scriptbox::capability {
namespace {

using ::google::protobuf::Value;
using ::scriptbox::CapabilityDescriptor;
using ::scriptbox::context::ExecutionContext;

absl::Status CheckRequiredContext(const CapabilityDescriptor& descriptor,
                                  const ExecutionContext& context) {
  for (const std::string& field : descriptor.requires_context()) {
    bool present = true;
    if (field == "domain") {
      present = !context.domain().empty();
    } else if (field == "tenantId") {
      present = !context.tenant_id().empty();
    } else if (field == "credentials") {
      present = !context.credential_handle().empty();
    }
    if (!present) {
      return absl::FailedPreconditionError(
          absl::Substitute("Capability $0 requires '$1' in the execution "
                           "context.",
                           descriptor.import_path(), field));
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<CapabilityRegistry>> CapabilityRegistry::Create(
    ::scriptbox::CapabilityCatalog catalog, FunctionMap functions) {
  RETURN_IF_ERROR(CheckCatalog(catalog));
  auto registry = absl::WrapUnique(
      new CapabilityRegistry(std::move(catalog), std::move(functions)));
  for (const auto& [import_path, function] : registry->functions_) {
    if (!registry->descriptors_.contains(import_path)) {
      return absl::InvalidArgumentError(absl::Substitute(
          "A function is bound to '$0', which is not in the catalog.",
          import_path));
    }
  }
  return registry;
}

CapabilityRegistry::CapabilityRegistry(::scriptbox::CapabilityCatalog catalog,
                                       FunctionMap functions)
    : catalog_(std::move(catalog)), functions_(std::move(functions)) {
  for (const auto& descriptor : catalog_.capabilities()) {
    descriptors_.insert({descriptor.import_path(), &descriptor});
  }
}

std::vector<const CapabilityDescriptor*> CapabilityRegistry::List() const {
  std::vector<const CapabilityDescriptor*> descriptors;
  descriptors.reserve(catalog_.capabilities_size());
  for (const auto& descriptor : catalog_.capabilities()) {
    descriptors.push_back(&descriptor);
  }
  return descriptors;
}

std::vector<const CapabilityDescriptor*> CapabilityRegistry::ListCategory(
    absl::string_view category) const {
  std::vector<const CapabilityDescriptor*> descriptors;
  for (const auto& descriptor : catalog_.capabilities()) {
    if (descriptor.category() == category) {
      descriptors.push_back(&descriptor);
    }
  }
  return descriptors;
}

absl::StatusOr<const CapabilityDescriptor*> CapabilityRegistry::Resolve(
    absl::string_view import_path) const {
  const auto it = descriptors_.find(CanonicalImportPath(import_path));
  if (it == descriptors_.end()) {
    return absl::NotFoundError(
        absl::Substitute("Capability $0 not found", import_path));
  }
  return it->second;
}

absl::StatusOr<const CapabilityFunction*> CapabilityRegistry::GetFunction(
    absl::string_view import_path) const {
  ASSIGN_OR_RETURN(const CapabilityDescriptor* descriptor,
                   Resolve(import_path));
  const auto it = functions_.find(descriptor->import_path());
  if (it == functions_.end() || it->second == nullptr) {
    return absl::UnavailableError(absl::Substitute(
        "Capability $0 is not available", descriptor->import_path()));
  }
  return it->second.get();
}

absl::StatusOr<Value> CapabilityRegistry::Invoke(
    absl::string_view import_path, const Value& input,
    const ExecutionContext& context) const {
  ASSIGN_OR_RETURN(const CapabilityDescriptor* descriptor,
                   Resolve(import_path));
  ASSIGN_OR_RETURN(const CapabilityFunction* function,
                   GetFunction(import_path));
  if (absl::Status status =
          ValidateAgainstSchema(input, descriptor->input_schema());
      !status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Validation failed: ", status.message()));
  }
  RETURN_IF_ERROR(CheckRequiredContext(*descriptor, context));
  ASSIGN_OR_RETURN(Value output, function->Call(input, context));
  if (absl::Status status = ValidateAgainstSchema(
          output, descriptor->output_schema(), "output");
      !status.ok()) {
    return absl::InternalError(absl::StrCat(
        descriptor->import_path(),
        " returned a result that breaks its contract: ", status.message()));
  }
  return output;
}

}  // namespace scriptbox::capability
