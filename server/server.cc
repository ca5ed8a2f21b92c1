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

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "absl/time/time.h"
#include "grpc++/ext/proto_server_reflection_plugin.h"
#include "grpc++/grpc++.h"
#include "sandbox/sandbox_executor.h"
#include "sandbox/scratch_sweeper.h"
#include "server/code_execution.h"
#include "server/execution_service.h"
#include "spdlog/spdlog.h"
#include "v8/v8_platform_initializer.h"

ABSL_FLAG(std::string,
          bind_address,
          "0.0.0.0:8080",
          "Server address to bind to.");

ABSL_FLAG(std::string,
          configuration_file,
          "",
          "Path to the configuration file in YAML format.");

ABSL_FLAG(absl::Duration,
          default_time_budget,
          absl::Seconds(30),
          "Time budget of requests that do not set one.");

ABSL_FLAG(absl::Duration,
          max_time_budget,
          absl::Seconds(60),
          "Largest time budget a request may use; larger ones are clamped.");

ABSL_FLAG(int,
          memory_limit_mb,
          512,
          "Memory ceiling of each script process, in MiB.");

ABSL_FLAG(int,
          max_concurrent_executions,
          4,
          "Number of scripts allowed to run at the same time.");

ABSL_FLAG(int,
          max_queued_executions,
          16,
          "Number of requests allowed to wait for an execution slot.");

ABSL_FLAG(int64_t,
          max_output_bytes,
          64 * 1024,
          "Limit for the serialized output value of a result.");

ABSL_FLAG(int64_t,
          max_stderr_bytes,
          8 * 1024,
          "Limit for the stderr excerpt of a result.");

ABSL_FLAG(std::string,
          scratch_root,
          "/tmp/scriptbox",
          "Directory holding the per-execution scratch directories.");

ABSL_FLAG(std::string,
          script_runner_path,
          "",
          "Path to the script_runner binary.");

ABSL_FLAG(std::string,
          log_level,
          "info",
          "Minimum severity logged: trace, debug, info, warn, err or "
          "critical.");

using grpc::Server;
using grpc::ServerBuilder;
using scriptbox::server::ExecutionServiceOptions;

ExecutionServiceOptions ExecutionServiceOptionsFromFlags() {
  ExecutionServiceOptions options;
  options.context.default_time_budget =
      absl::GetFlag(FLAGS_default_time_budget);
  options.context.max_time_budget = absl::GetFlag(FLAGS_max_time_budget);
  options.context.scratch_root = absl::GetFlag(FLAGS_scratch_root);
  options.pool.max_concurrent = absl::GetFlag(FLAGS_max_concurrent_executions);
  options.pool.max_queued = absl::GetFlag(FLAGS_max_queued_executions);
  options.result.max_output_bytes = absl::GetFlag(FLAGS_max_output_bytes);
  options.result.max_stderr_bytes = absl::GetFlag(FLAGS_max_stderr_bytes);
  return options;
}

void RunServer() {
  std::string server_address = absl::GetFlag(FLAGS_bind_address);
  scriptbox::sandbox::SandboxOptions sandbox_options;
  sandbox_options.runner_path = absl::GetFlag(FLAGS_script_runner_path);
  sandbox_options.memory_limit_bytes =
      static_cast<size_t>(absl::GetFlag(FLAGS_memory_limit_mb)) << 20;
  if (sandbox_options.runner_path.empty()) {
    spdlog::critical("--script_runner_path is required");
    exit(1);
  }

  auto service_or = scriptbox::server::CodeExecutionImpl::Create(
      absl::GetFlag(FLAGS_configuration_file),
      ExecutionServiceOptionsFromFlags(),
      [sandbox_options](
          const scriptbox::capability::CapabilityRegistry* registry) {
        return std::make_unique<scriptbox::sandbox::SandboxExecutor>(
            sandbox_options, registry);
      });
  if (!service_or.ok()) {
    spdlog::critical("Unable to initialize the server: {}",
                     service_or.status().ToString());
    exit(1);
  }

  // Catches scratch directories left behind by a crashed server.
  scriptbox::sandbox::ScratchSweeper scratch_sweeper(
      absl::GetFlag(FLAGS_scratch_root),
      2 * absl::GetFlag(FLAGS_max_time_budget), absl::Minutes(5));

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  ServerBuilder builder;
  // Listen on the given address without any authentication mechanism.
  int bound_port = 0;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(service_or.value().get());
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (bound_port != 0) {
    spdlog::info("Server listening on {}", server_address);
    server->Wait();
  } else {
    spdlog::critical("Unable to bind to address {}. Exiting.", server_address);
    exit(1);
  }
}

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  spdlog::set_level(spdlog::level::from_str(absl::GetFlag(FLAGS_log_level)));
  // Initialize V8 for the validator.
  scriptbox::v8::V8PlatformInitializer v8_platform_initializer;
  RunServer();
  return 0;
}
