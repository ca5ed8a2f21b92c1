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

#include "capability/capability_discovery.h"

#include "capability/capability_catalog.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scriptbox::capability {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Property;
using ::testing::SizeIs;

class CapabilityDiscoveryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto registry = CapabilityRegistry::Create(BuiltinCatalog().value(), {});
    ASSERT_TRUE(registry.ok()) << registry.status();
    registry_ = std::move(registry).value();
    discovery_ = std::make_unique<CapabilityDiscovery>(*registry_);
  }

  std::unique_ptr<CapabilityRegistry> registry_;
  std::unique_ptr<CapabilityDiscovery> discovery_;
};

TEST_F(CapabilityDiscoveryTest, SummariesCarryOnlyPathAndDescription) {
  auto summaries = discovery_->Summaries();
  ASSERT_THAT(summaries, SizeIs(6));
  EXPECT_EQ(summaries[0].import_path(), "servers/search/searchProducts");
  EXPECT_THAT(summaries[0].description(), HasSubstr("Search products"));
  EXPECT_THAT(discovery_->Summaries("content"),
              ElementsAre(Property(&CapabilitySummary::import_path,
                                   "servers/content/getCompletePageDetails")));
  EXPECT_THAT(discovery_->Summaries("admin"), SizeIs(0));
}

TEST_F(CapabilityDiscoveryTest, ListingGroupsByCategoryWithoutSchemas) {
  const std::string listing = discovery_->RenderListing();
  EXPECT_THAT(listing, HasSubstr("catalog 1.0.0"));
  EXPECT_THAT(listing, HasSubstr("\nsearch: "));
  EXPECT_THAT(listing, HasSubstr("\ncommerce: "));
  EXPECT_THAT(listing, HasSubstr("  ./servers/commerce/lookupOrder - "));
  EXPECT_THAT(listing, Not(HasSubstr("minLength")));
  EXPECT_THAT(listing, Not(HasSubstr("check_refund_status")));
}

TEST_F(CapabilityDiscoveryTest, ListingCanBeRestrictedToOneCategory) {
  const std::string listing = discovery_->RenderListing("content");
  EXPECT_THAT(listing, HasSubstr("\ncontent: "));
  EXPECT_THAT(listing, Not(HasSubstr("\nsearch: ")));
  EXPECT_THAT(listing, Not(HasSubstr("searchProducts")));
}

TEST_F(CapabilityDiscoveryTest, DescribeReturnsFullContract) {
  auto descriptor =
      discovery_->Describe("./servers/commerce/woocommerceOperations.ts");
  ASSERT_TRUE(descriptor.ok()) << descriptor.status();
  EXPECT_TRUE(descriptor->side_effects());
  EXPECT_TRUE(descriptor->input_schema().fields().contains("properties"));
  EXPECT_EQ(discovery_->Describe("servers/admin/deleteAllUsers").status().code(),
            absl::StatusCode::kNotFound);
}

TEST_F(CapabilityDiscoveryTest, DescribeImportsSkipsRuntimeModulesAndRepeats) {
  const std::vector<std::string> imports = {
      "servers/search/searchProducts", "std/text",
      "./servers/search/searchProducts.ts", "servers/commerce/lookupOrder"};
  auto descriptors = discovery_->DescribeImports(imports);
  EXPECT_THAT(descriptors,
              ElementsAre(Property(&CapabilityDescriptor::name,
                                   "searchProducts"),
                          Property(&CapabilityDescriptor::name,
                                   "lookupOrder")));
}

}  // namespace
}  // namespace scriptbox::capability
