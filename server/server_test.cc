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

#include <stdlib.h>

#include <chrono>
#include <fstream>
#include <thread>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "grpc++/grpc++.h"
#include "gtest/gtest.h"
#include "httplib.h"
#include "proto/scriptbox.grpc.pb.h"
#include "subprocess.hpp"
#include "util/parse_proto.h"
#include "util/unused_port.h"

namespace scriptbox {
namespace server {

using ::scriptbox::util::FindUnusedPort;
using ::scriptbox::util::ParseTextOrDie;
using ::testing::HasSubstr;
using ::testing::Not;

constexpr char kTenantSecret[] = "sk_live_e2e_secret";

// Starts a fake search backend and a Scriptbox server in a separate process
// on random local unused ports.
class ScriptboxServer : public ::testing::Environment {
 public:
  static std::string ConfigurationFileName() {
    return absl::StrCat(testing::TempDir(), "/test_configuration.yaml");
  }

  static std::string WriteYamlConfiguration(absl::string_view yaml_source) {
    std::string configuration_filename = ConfigurationFileName();
    std::ofstream configuration_file;
    configuration_file.open(configuration_filename);
    configuration_file << yaml_source;
    configuration_file.close();
    return configuration_filename;
  }

  void StartBackendServer() {
    backend_port_ = FindUnusedPort().value();
    absl::Notification server_ready;
    backend_server_thread_ = std::make_unique<std::thread>(
        [this, &server_ready] {
          backend_server_.bind_to_port("127.0.0.1", backend_port_);
          server_ready.Notify();
          backend_server_.listen_after_bind();
        });
    ASSERT_TRUE(server_ready.WaitForNotificationWithTimeout(absl::Seconds(5)));
    backend_server_.Post("/search", [](const httplib::Request& req,
                                       httplib::Response& res) {
      if (req.get_header_value("Authorization") !=
          absl::StrCat("Bearer ", kTenantSecret)) {
        res.status = 401;
        return;
      }
      res.set_content(
          R"({"success": true, "data": {"products": [
                {"sku": "L-1", "category": "lamps", "price": 20},
                {"sku": "L-2", "category": "lamps", "price": 30},
                {"sku": "D-1", "category": "desks", "price": 150}]}})",
          "application/json");
    });
    backend_server_.Post("/stalled", [this](const httplib::Request&,
                                            httplib::Response& res) {
      release_backend_.WaitForNotificationWithTimeout(absl::Seconds(30));
      res.set_content(R"({"success": true})", "application/json");
    });
  }

  void StopBackendServer() {
    release_backend_.Notify();
    backend_server_.stop();
    backend_server_thread_->join();
  }

  void StartGrpcServer() {
    address_ = absl::StrCat("127.0.0.1:", FindUnusedPort().value());
    server_process_ =
        subprocess::RunBuilder(
            {SCRIPTBOX_SERVER_PATH, absl::StrCat("--bind_address=", address_),
             absl::StrCat("--configuration_file=", ConfigurationFileName()),
             absl::StrCat("--script_runner_path=", SCRIPTBOX_RUNNER_PATH),
             absl::StrCat("--scratch_root=", testing::TempDir(), "/scratch"),
             "--max_time_budget=10s"})
            .popen();
    ASSERT_TRUE(WaitUntilServerIsReady());
  }

  void StopGrpcServer() { server_process_.kill(); }

  void SetUp() override {
    StartBackendServer();
    setenv("SCRIPTBOX_E2E_TOKEN", kTenantSecret, /*overwrite=*/1);
    WriteYamlConfiguration(absl::Substitute(R"(
capabilityBackends:
- importPath: servers/search/searchProducts
  endpoint: http://127.0.0.1:$0/search
- importPath: servers/search/searchByCategory
  endpoint: http://127.0.0.1:$0/stalled
credentials:
- handle: tenant-a
  secretEnv: SCRIPTBOX_E2E_TOKEN
)",
                                            backend_port_));
    StartGrpcServer();
  }

  void TearDown() override {
    StopGrpcServer();
    StopBackendServer();
  }

  std::string Address() const { return address_; }

 private:
  // Waits until server under test is ready to accept connections.
  // Returns true if the server is accepting connections.
  bool WaitUntilServerIsReady() const {
    int retries = 25;
    do {
      auto channel =
          grpc::CreateChannel(Address(), grpc::InsecureChannelCredentials());
      if (channel->WaitForConnected(std::chrono::system_clock::now() +
                                    std::chrono::milliseconds(200))) {
        return true;
      }
    } while (--retries > 0);
    return false;
  }

  std::string address_;
  subprocess::Popen server_process_;
  httplib::Server backend_server_;
  absl::Notification release_backend_;
  int backend_port_ = 0;
  std::unique_ptr<std::thread> backend_server_thread_;
};

// Creates a single environment per T and register as a GlobalTestEnvironment.
template <typename T>
T* GetEnv() {
  static T* const instance = [] {
    T* instance = new T;
    ::testing::AddGlobalTestEnvironment(instance);
    return instance;
  }();
  return instance;
}

ScriptboxServer* const scriptbox_server = GetEnv<ScriptboxServer>();

class ServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    stub_ = CodeExecution::NewStub(
        grpc::CreateChannel(GetEnv<ScriptboxServer>()->Address(),
                            grpc::InsecureChannelCredentials()));
  }

  absl::StatusOr<ExecutionResult> ExecuteCode(
      const ExecutionRequest& request) {
    ::grpc::ClientContext client_context;
    ExecutionResult response;
    const grpc::Status status =
        stub_->ExecuteCode(&client_context, request, &response);
    if (!status.ok()) {
      return absl::Status(static_cast<absl::StatusCode>(status.error_code()),
                          status.error_message());
    }
    return response;
  }

  std::unique_ptr<CodeExecution::Stub> stub_;
};

TEST_F(ServerTest, HappyPath) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "import { searchProducts } from './servers/search/searchProducts.ts';\n"
                 "import { groupBy } from 'std/collections';\n"
                 "const found = await searchProducts({ query: 'lamp' });\n"
                 "const groups = groupBy(found.data.products, (p) => p.category);\n"
                 "console.log('grouping');\n"
                 "console.log(JSON.stringify({ lamps: groups.lamps.length }));\n"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
    credential_handle: "tenant-a"
    time_budget_ms: 5000
  )pb");
  auto response = ExecuteCode(request);
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status(), ExecutionResult::SUCCESS)
      << response->DebugString();
  EXPECT_EQ(
      response->output().struct_value().fields().at("lamps").number_value(),
      2);
  EXPECT_EQ(response->capabilities_used_size(), 1);
  EXPECT_FALSE(response->execution_id().empty());
}

TEST_F(ServerTest, ValidationFailure) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "const p = globalThis['pro' + 'cess'];\nconsole.log(p.env);"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
  )pb");
  auto response = ExecuteCode(request);
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status(), ExecutionResult::VALIDATION_FAILED);
  EXPECT_FALSE(response->has_output());
}

TEST_F(ServerTest, InfiniteLoopTimesOut) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "let i = 0;\nwhile (true) { i++; }"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
    time_budget_ms: 1000
  )pb");
  auto response = ExecuteCode(request);
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status(), ExecutionResult::TIMEOUT);
  EXPECT_LT(response->duration_ms(), 5000);
}

TEST_F(ServerTest, StalledBackendTimesOutWithinBudget) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "import { searchByCategory } from './servers/search/searchByCategory.ts';\n"
                 "const found = await searchByCategory({ category: 'lamps' });\n"
                 "console.log(JSON.stringify(found));\n"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
    credential_handle: "tenant-a"
    time_budget_ms: 1000
  )pb");
  auto response = ExecuteCode(request);
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status(), ExecutionResult::TIMEOUT)
      << response->DebugString();
  EXPECT_LT(response->duration_ms(), 3000);
}

TEST_F(ServerTest, ScriptErrorDoesNotLeakSecret) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "import { searchProducts } from './servers/search/searchProducts.ts';\n"
                 "const found = await searchProducts({ query: 'lamp' });\n"
                 "throw new Error('no desks in ' + JSON.stringify(found));\n"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
    credential_handle: "tenant-a"
  )pb");
  auto response = ExecuteCode(request);
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status(), ExecutionResult::RUNTIME_ERROR);
  EXPECT_THAT(response->stderr_excerpt(), HasSubstr("no desks in"));
  EXPECT_THAT(response->stderr_excerpt(), Not(HasSubstr(kTenantSecret)));
}

TEST_F(ServerTest, DescribeUnknownCapability) {
  DescribeCapabilityRequest request;
  request.set_import_path("servers/admin/deleteEverything");
  ::grpc::ClientContext client_context;
  CapabilityDescriptor response;
  EXPECT_EQ(stub_->DescribeCapability(&client_context, request, &response)
                .error_code(),
            grpc::StatusCode::NOT_FOUND);
}

}  // namespace server
}  // namespace scriptbox
