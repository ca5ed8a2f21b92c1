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

#include <fstream>
#include <memory>
#include <string>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "grpc++/grpc++.h"
#include "gtest/gtest.h"
#include "util/parse_proto.h"
#include "v8/v8_platform_initializer.h"

namespace scriptbox::server {
namespace {

using ::scriptbox::sandbox::RawExecutionOutcome;
using ::scriptbox::util::ParseTextOrDie;
using ::scriptbox::v8::V8PlatformInitializer;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Property;
using ::testing::SizeIs;

std::string WriteConfiguration(absl::string_view name,
                               absl::string_view yaml_source) {
  const std::string file_name = absl::StrCat(testing::TempDir(), "/", name);
  std::ofstream configuration_file(file_name);
  configuration_file << yaml_source;
  return file_name;
}

// Completes every run with the same stdout.
class EchoExecutor : public sandbox::ScriptExecutorInterface {
 public:
  explicit EchoExecutor(std::string stdout_bytes)
      : stdout_bytes_(std::move(stdout_bytes)) {}

  RawExecutionOutcome Execute(
      absl::string_view source, absl::Span<const std::string> imports,
      const context::ExecutionContext& context) const override {
    RawExecutionOutcome outcome;
    outcome.state = RawExecutionOutcome::State::kCompleted;
    outcome.exit_code = 0;
    outcome.stdout_bytes = stdout_bytes_;
    return outcome;
  }

 private:
  const std::string stdout_bytes_;
};

TEST(LoadConfigurationTest, ReadsBackendsAndCredentials) {
  auto configuration = LoadConfiguration(WriteConfiguration("full.yaml", R"(
capabilityBackends:
- importPath: ./servers/search/searchProducts.ts
  endpoint: http://localhost:9001/search
credentials:
- handle: tenant-a
  secret: sk_a
- handle: tenant-b
  secretEnv: TENANT_B_TOKEN
)"));
  ASSERT_TRUE(configuration.ok()) << configuration.status();
  ASSERT_THAT(configuration->capability_backends, SizeIs(1));
  EXPECT_EQ(configuration->capability_backends[0].endpoint,
            "http://localhost:9001/search");
  ASSERT_THAT(configuration->credentials, SizeIs(2));
  EXPECT_EQ(configuration->credentials[0].secret, "sk_a");
  EXPECT_EQ(configuration->credentials[1].secret_env, "TENANT_B_TOKEN");
}

TEST(LoadConfigurationTest, EmptyFileIsEmptyConfiguration) {
  auto configuration = LoadConfiguration(WriteConfiguration("empty.yaml", ""));
  ASSERT_TRUE(configuration.ok()) << configuration.status();
  EXPECT_TRUE(configuration->capability_backends.empty());
  EXPECT_TRUE(configuration->credentials.empty());
}

TEST(LoadConfigurationTest, ReportsBadFiles) {
  EXPECT_EQ(LoadConfiguration("/nonexistent/scriptbox.yaml").status().code(),
            absl::StatusCode::kNotFound);
  EXPECT_EQ(LoadConfiguration(WriteConfiguration("broken.yaml", "a: [b"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(LoadConfiguration(WriteConfiguration("both.yaml", R"(
credentials:
- handle: tenant-a
  secret: sk_a
  secretEnv: TENANT_A_TOKEN
)"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(CodeExecutionImplCreateTest, RejectsDuplicateBackends) {
  Configuration configuration;
  configuration.capability_backends = {
      {"servers/search/searchProducts", "http://localhost:9001/a"},
      {"./servers/search/searchProducts.ts", "http://localhost:9001/b"}};
  auto service = CodeExecutionImpl::Create(
      configuration, ExecutionServiceOptions{},
      [](const capability::CapabilityRegistry*) {
        return std::make_unique<EchoExecutor>("null");
      });
  EXPECT_EQ(service.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CodeExecutionImplCreateTest, RejectsUnknownCapability) {
  Configuration configuration;
  configuration.capability_backends = {
      {"servers/admin/deleteEverything", "http://localhost:9001/a"}};
  auto service = CodeExecutionImpl::Create(
      configuration, ExecutionServiceOptions{},
      [](const capability::CapabilityRegistry*) {
        return std::make_unique<EchoExecutor>("null");
      });
  EXPECT_FALSE(service.ok());
}

class CodeExecutionImplTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Configuration configuration;
    configuration.capability_backends = {
        {"servers/search/searchProducts", "http://localhost:9001/search"}};
    configuration.credentials = {{"tenant-a", "sk_live_tenant_a", ""}};
    auto service = CodeExecutionImpl::Create(
        configuration, ExecutionServiceOptions{},
        [](const capability::CapabilityRegistry*) {
          return std::make_unique<EchoExecutor>(
              "{\"note\": \"token sk_live_tenant_a\"}\n");
        });
    ASSERT_TRUE(service.ok()) << service.status();
    service_ = std::move(service).value();

    int port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort("localhost:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(port, 0);
    stub_ = CodeExecution::NewStub(
        grpc::CreateChannel(absl::StrCat("localhost:", port),
                            grpc::InsecureChannelCredentials()));
  }

  void TearDown() override { server_->Shutdown(); }

  V8PlatformInitializer v8_platform_initializer_;
  std::unique_ptr<CodeExecutionImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<CodeExecution::Stub> stub_;
};

TEST_F(CodeExecutionImplTest, ExecuteCodeReturnsRedactedResult) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "import { searchProducts } from './servers/search/searchProducts.ts';\nconsole.log(JSON.stringify(await searchProducts({ query: 'x' })));"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
    credential_handle: "tenant-a"
  )pb");
  grpc::ClientContext client_context;
  ExecutionResult response;
  const grpc::Status status =
      stub_->ExecuteCode(&client_context, request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), ExecutionResult::SUCCESS);
  EXPECT_EQ(
      response.output().struct_value().fields().at("note").string_value(),
      "token [REDACTED]");
  EXPECT_THAT(response.capabilities_used(),
              ElementsAre(Property(&CapabilityDescriptor::name,
                                   "searchProducts")));
}

TEST_F(CodeExecutionImplTest, ExecuteCodeReportsValidationFailure) {
  auto request = ParseTextOrDie<ExecutionRequest>(R"pb(
    source_code: "import fs from 'fs';\nconsole.log(fs.readFileSync('/etc/passwd'));"
    tenant_id: "tenant-a"
    domain: "shop.example.com"
  )pb");
  grpc::ClientContext client_context;
  ExecutionResult response;
  ASSERT_TRUE(stub_->ExecuteCode(&client_context, request, &response).ok());
  EXPECT_EQ(response.status(), ExecutionResult::VALIDATION_FAILED);
  EXPECT_EQ(response.validation_stage(), ValidationResult::IMPORTS);
  EXPECT_FALSE(response.has_output());
}

TEST_F(CodeExecutionImplTest, ValidateCode) {
  ValidateCodeRequest request;
  request.set_source_code("console.log(JSON.stringify([1, 2, 3]));");
  grpc::ClientContext client_context;
  ValidationResult response;
  ASSERT_TRUE(stub_->ValidateCode(&client_context, request, &response).ok());
  EXPECT_TRUE(response.ok());
}

TEST_F(CodeExecutionImplTest, ListCapabilitiesFiltersByCategory) {
  ListCapabilitiesRequest request;
  request.set_category("search");
  grpc::ClientContext client_context;
  ListCapabilitiesResponse response;
  ASSERT_TRUE(
      stub_->ListCapabilities(&client_context, request, &response).ok());
  EXPECT_EQ(response.catalog_version(), "1.0.0");
  EXPECT_THAT(response.capabilities(),
              ElementsAre(Property(&CapabilitySummary::import_path,
                                   "servers/search/searchProducts"),
                          Property(&CapabilitySummary::import_path,
                                   "servers/search/searchByCategory")));
  EXPECT_THAT(response.listing(), HasSubstr("./servers/search/searchProducts"));
  EXPECT_THAT(response.listing(), Not(HasSubstr("lookupOrder")));
}

TEST_F(CodeExecutionImplTest, DescribeCapability) {
  DescribeCapabilityRequest request;
  request.set_import_path("./servers/commerce/lookupOrder.ts");
  grpc::ClientContext client_context;
  CapabilityDescriptor response;
  ASSERT_TRUE(
      stub_->DescribeCapability(&client_context, request, &response).ok());
  EXPECT_EQ(response.import_path(), "servers/commerce/lookupOrder");
  EXPECT_TRUE(response.input_schema().fields().contains("properties"));

  grpc::ClientContext unknown_context;
  request.set_import_path("servers/admin/deleteEverything");
  EXPECT_EQ(
      stub_->DescribeCapability(&unknown_context, request, &response)
          .error_code(),
      grpc::StatusCode::NOT_FOUND);
}

}  // namespace
}  // namespace scriptbox::server
