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

#ifndef SERVER_CODE_EXECUTION_H_
#define SERVER_CODE_EXECUTION_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "capability/capability_registry.h"
#include "capability/credential_store.h"
#include "grpc++/grpc++.h"
#include "proto/scriptbox.grpc.pb.h"
#include "proto/scriptbox.pb.h"
#include "sandbox/script_executor_interface.h"
#include "server/execution_service.h"

namespace scriptbox::server {

// Binds one catalog capability to the platform backend that implements it.
struct CapabilityBackendSpecification {
  std::string import_path;
  std::string endpoint;
};

// Deployment wiring read from the server YAML configuration:
//
//   capabilityBackends:
//   - importPath: servers/search/searchProducts
//     endpoint: http://search.internal:8080/v1/search
//   credentials:
//   - handle: tenant-a
//     secretEnv: TENANT_A_TOKEN
struct Configuration {
  std::vector<CapabilityBackendSpecification> capability_backends;
  std::vector<capability::CredentialSpecification> credentials;
};

absl::StatusOr<Configuration> LoadConfiguration(
    absl::string_view configuration_file_name);

// Creates the executor that runs scripts against `registry`.
using ExecutorFactory =
    std::function<std::unique_ptr<sandbox::ScriptExecutorInterface>(
        const capability::CapabilityRegistry* registry)>;

// Implements the CodeExecution gRPC service.
class CodeExecutionImpl final : public ::scriptbox::CodeExecution::Service {
 public:
  static absl::StatusOr<std::unique_ptr<CodeExecutionImpl>> Create(
      const Configuration& configuration,
      const ExecutionServiceOptions& options,
      const ExecutorFactory& executor_factory);

  static absl::StatusOr<std::unique_ptr<CodeExecutionImpl>> Create(
      absl::string_view configuration_file_name,
      const ExecutionServiceOptions& options,
      const ExecutorFactory& executor_factory);

  grpc::Status ExecuteCode(::grpc::ServerContext* context,
                           const ::scriptbox::ExecutionRequest* request,
                           ::scriptbox::ExecutionResult* response) override;

  grpc::Status ValidateCode(::grpc::ServerContext* context,
                            const ::scriptbox::ValidateCodeRequest* request,
                            ::scriptbox::ValidationResult* response) override;

  grpc::Status ListCapabilities(
      ::grpc::ServerContext* context,
      const ::scriptbox::ListCapabilitiesRequest* request,
      ::scriptbox::ListCapabilitiesResponse* response) override;

  grpc::Status DescribeCapability(
      ::grpc::ServerContext* context,
      const ::scriptbox::DescribeCapabilityRequest* request,
      ::scriptbox::CapabilityDescriptor* response) override;

 private:
  CodeExecutionImpl(std::unique_ptr<capability::CredentialStore> credentials,
                    std::unique_ptr<capability::CapabilityRegistry> registry,
                    const ExecutionServiceOptions& options,
                    const ExecutorFactory& executor_factory);

  // Declared in dependency order: the service uses the registry, whose
  // functions use the credential store.
  const std::unique_ptr<capability::CredentialStore> credentials_;
  const std::unique_ptr<capability::CapabilityRegistry> registry_;
  const ExecutionService execution_service_;
};

}  // namespace scriptbox::server

#endif  // SERVER_CODE_EXECUTION_H_
