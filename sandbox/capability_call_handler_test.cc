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

#include "sandbox/capability_call_handler.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "capability/capability_catalog.h"
#include "gmock/gmock.h"
#include "google/protobuf/util/message_differencer.h"
#include "gtest/gtest.h"
#include "util/json.h"
#include "util/parse_proto.h"

namespace scriptbox::sandbox {
namespace {

using ::google::protobuf::Value;
using ::google::protobuf::util::MessageDifferencer;
using ::scriptbox::capability::CapabilityRegistry;
using ::scriptbox::capability::LambdaCapabilityFunction;
using ::scriptbox::context::ExecutionContext;
using ::scriptbox::context::ExecutionContextBuilder;
using ::scriptbox::context::ExecutionContextOptions;
using ::scriptbox::util::ParseTextOrDie;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class CapabilityCallHandlerTest : public ::testing::Test {
 protected:
  CapabilityCallHandlerTest()
      : context_(ExecutionContextBuilder(ExecutionContextOptions{})
                     .Build("tenant-1", "shop.example.com", "", 1000,
                            absl::Now())
                     .value()) {
    CapabilityRegistry::FunctionMap functions;
    functions["servers/search/searchProducts"] =
        std::make_unique<LambdaCapabilityFunction>(
            [this](const Value& input, const ExecutionContext& context)
                -> absl::StatusOr<Value> {
              seen_domain_ = context.domain();
              return util::ParseJsonValue(
                  R"({"success": true, "data": {"count": 2}})");
            });
    registry_ =
        CapabilityRegistry::Create(capability::BuiltinCatalog().value(),
                                   std::move(functions))
            .value();
  }

  CapabilityReply Handle(absl::string_view call_text) {
    CapabilityCallHandler handler(registry_.get(), imports_, &context_);
    return handler.Handle(ParseTextOrDie<CapabilityCall>(call_text));
  }

  ExecutionContext context_;
  std::unique_ptr<CapabilityRegistry> registry_;
  std::vector<std::string> imports_ = {"servers/search/searchProducts",
                                       "servers/commerce/lookupOrder"};
  std::string seen_domain_;
};

TEST_F(CapabilityCallHandlerTest, AnswersWithCapabilityOutput) {
  CapabilityReply reply = Handle(R"pb(
    call_id: 4
    import_path: "servers/search/searchProducts"
    input_json: '{"query":"pump","limit":5}'
  )pb");
  EXPECT_EQ(reply.call_id(), 4);
  EXPECT_EQ(reply.status().code(), 0);
  auto output = util::ParseJsonValue(reply.output_json());
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_TRUE(MessageDifferencer::Equals(
      *output,
      util::ParseJsonValue(R"({"success": true, "data": {"count": 2}})")
          .value()));
  EXPECT_EQ(seen_domain_, "shop.example.com");
}

TEST_F(CapabilityCallHandlerTest, ReportsSchemaViolations) {
  CapabilityReply reply = Handle(R"pb(
    call_id: 1
    import_path: "servers/search/searchProducts"
    input_json: '{"query": 3}'
  )pb");
  EXPECT_EQ(reply.status().code(),
            static_cast<int>(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(reply.status().message(), StartsWith("Validation failed:"));
  EXPECT_TRUE(reply.output_json().empty());
}

TEST_F(CapabilityCallHandlerTest, RefusesPathsTheScriptDidNotImport) {
  CapabilityReply reply = Handle(R"pb(
    call_id: 2
    import_path: "servers/search/searchByCategory"
    input_json: '{"category":"pumps"}'
  )pb");
  EXPECT_EQ(reply.status().code(),
            static_cast<int>(absl::StatusCode::kPermissionDenied));
}

TEST_F(CapabilityCallHandlerTest, UnboundCapabilityIsUnavailable) {
  CapabilityReply reply = Handle(R"pb(
    call_id: 3
    import_path: "servers/commerce/lookupOrder"
    input_json: '{"orderId":"1"}'
  )pb");
  EXPECT_EQ(reply.status().code(),
            static_cast<int>(absl::StatusCode::kUnavailable));
  EXPECT_THAT(reply.status().message(), HasSubstr("not available"));
}

TEST_F(CapabilityCallHandlerTest, RejectsMalformedJson) {
  CapabilityReply reply = Handle(R"pb(
    call_id: 5
    import_path: "servers/search/searchProducts"
    input_json: '{"query":'
  )pb");
  EXPECT_EQ(reply.status().code(),
            static_cast<int>(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace scriptbox::sandbox
