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

#include "server/code_execution.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/substitute.h"
#include "capability/capability_catalog.h"
#include "capability/http_capability_function.h"
#include "capability/import_path.h"
#include "spdlog/spdlog.h"
#include "util/status_macros.h"
#include "yaml-cpp/yaml.h"

namespace YAML {
template <>
struct convert<::scriptbox::server::CapabilityBackendSpecification> {
  static bool decode(
      const YAML::Node& node,
      ::scriptbox::server::CapabilityBackendSpecification& decoded) {
    if (!node.IsMap()) {
      return false;
    }
    const auto import_path_node = node["importPath"];
    if (import_path_node.IsDefined()) {
      decoded.import_path = import_path_node.as<std::string>();
    }
    const auto endpoint_node = node["endpoint"];
    if (endpoint_node.IsDefined()) {
      decoded.endpoint = endpoint_node.as<std::string>();
    }
    return !decoded.import_path.empty() && !decoded.endpoint.empty();
  }
};

template <>
struct convert<::scriptbox::capability::CredentialSpecification> {
  static bool decode(
      const YAML::Node& node,
      ::scriptbox::capability::CredentialSpecification& decoded) {
    if (!node.IsMap()) {
      return false;
    }
    const auto handle_node = node["handle"];
    if (handle_node.IsDefined()) {
      decoded.handle = handle_node.as<std::string>();
    }
    const auto secret_node = node["secret"];
    if (secret_node.IsDefined()) {
      decoded.secret = secret_node.as<std::string>();
    }
    const auto secret_env_node = node["secretEnv"];
    if (secret_env_node.IsDefined()) {
      decoded.secret_env = secret_env_node.as<std::string>();
    }
    // Exactly one source for the secret.
    return !decoded.handle.empty() &&
           decoded.secret.empty() != decoded.secret_env.empty();
  }
};
}  // namespace YAML

namespace scriptbox::server {

namespace {

grpc::Status ToGrpcStatus(const absl::Status& status) {
  return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
                      std::string(status.message()));
}

absl::StatusOr<capability::CapabilityRegistry::FunctionMap>
CreateCapabilityFunctions(const Configuration& configuration,
                          const capability::CredentialStore& credentials) {
  capability::CapabilityRegistry::FunctionMap functions;
  for (const auto& backend : configuration.capability_backends) {
    ASSIGN_OR_RETURN(auto function,
                     capability::HttpCapabilityFunction::Create(
                         backend.endpoint, credentials));
    const std::string import_path =
        capability::CanonicalImportPath(backend.import_path);
    if (!functions.emplace(import_path, std::move(function)).second) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Capability '$0' bound more than once in the configuration file.",
          import_path));
    }
  }
  return functions;
}

}  // namespace

absl::StatusOr<Configuration> LoadConfiguration(
    absl::string_view configuration_file_name) {
  try {
    const YAML::Node config =
        YAML::LoadFile(std::string(configuration_file_name));
    Configuration configuration;
    if (config["capabilityBackends"].IsDefined()) {
      configuration.capability_backends =
          config["capabilityBackends"]
              .as<std::vector<CapabilityBackendSpecification>>();
    }
    if (config["credentials"].IsDefined()) {
      configuration.credentials =
          config["credentials"]
              .as<std::vector<capability::CredentialSpecification>>();
    }
    return configuration;
  } catch (YAML::BadFile&) {
    return absl::NotFoundError("Could not open the YAML configuration file");
  } catch (YAML::ParserException&) {
    return absl::InvalidArgumentError(
        "Parsing failure reading the YAML configuration file");
  } catch (YAML::RepresentationException&) {
    return absl::InvalidArgumentError("Malformed YAML configuration");
  }
}

absl::StatusOr<std::unique_ptr<CodeExecutionImpl>> CodeExecutionImpl::Create(
    absl::string_view configuration_file_name,
    const ExecutionServiceOptions& options,
    const ExecutorFactory& executor_factory) {
  ASSIGN_OR_RETURN(auto configuration,
                   LoadConfiguration(configuration_file_name));
  return Create(configuration, options, executor_factory);
}

absl::StatusOr<std::unique_ptr<CodeExecutionImpl>> CodeExecutionImpl::Create(
    const Configuration& configuration, const ExecutionServiceOptions& options,
    const ExecutorFactory& executor_factory) {
  ASSIGN_OR_RETURN(auto credentials,
                   capability::CredentialStore::Create(
                       configuration.credentials));
  ASSIGN_OR_RETURN(auto functions,
                   CreateCapabilityFunctions(configuration, *credentials));
  ASSIGN_OR_RETURN(auto catalog, capability::BuiltinCatalog());
  ASSIGN_OR_RETURN(auto registry,
                   capability::CapabilityRegistry::Create(
                       std::move(catalog), std::move(functions)));
  spdlog::info("Loaded capability catalog {} with {} backend(s) and {} "
               "credential handle(s)",
               registry->catalog_version(),
               configuration.capability_backends.size(),
               configuration.credentials.size());
  return absl::WrapUnique(new CodeExecutionImpl(std::move(credentials),
                                                std::move(registry), options,
                                                executor_factory));
}

CodeExecutionImpl::CodeExecutionImpl(
    std::unique_ptr<capability::CredentialStore> credentials,
    std::unique_ptr<capability::CapabilityRegistry> registry,
    const ExecutionServiceOptions& options,
    const ExecutorFactory& executor_factory)
    : credentials_(std::move(credentials)),
      registry_(std::move(registry)),
      execution_service_(options, registry_.get(),
                         executor_factory(registry_.get()),
                         credentials_->Secrets()) {}

grpc::Status CodeExecutionImpl::ExecuteCode(
    ::grpc::ServerContext* context,
    const ::scriptbox::ExecutionRequest* request,
    ::scriptbox::ExecutionResult* response) {
  *response = execution_service_.Execute(*request);
  return grpc::Status::OK;
}

grpc::Status CodeExecutionImpl::ValidateCode(
    ::grpc::ServerContext* context,
    const ::scriptbox::ValidateCodeRequest* request,
    ::scriptbox::ValidationResult* response) {
  *response = execution_service_.Validate(*request);
  return grpc::Status::OK;
}

grpc::Status CodeExecutionImpl::ListCapabilities(
    ::grpc::ServerContext* context,
    const ::scriptbox::ListCapabilitiesRequest* request,
    ::scriptbox::ListCapabilitiesResponse* response) {
  const auto& discovery = execution_service_.discovery();
  response->set_catalog_version(registry_->catalog_version());
  for (auto& summary : discovery.Summaries(request->category())) {
    *response->add_capabilities() = std::move(summary);
  }
  response->set_listing(discovery.RenderListing(request->category()));
  return grpc::Status::OK;
}

grpc::Status CodeExecutionImpl::DescribeCapability(
    ::grpc::ServerContext* context,
    const ::scriptbox::DescribeCapabilityRequest* request,
    ::scriptbox::CapabilityDescriptor* response) {
  absl::StatusOr<CapabilityDescriptor> descriptor =
      execution_service_.discovery().Describe(request->import_path());
  if (!descriptor.ok()) {
    return ToGrpcStatus(descriptor.status());
  }
  *response = std::move(descriptor).value();
  return grpc::Status::OK;
}

}  // namespace scriptbox::server
