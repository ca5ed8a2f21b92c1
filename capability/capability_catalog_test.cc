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

#include "capability/capability_catalog.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/parse_proto.h"

namespace scriptbox::capability {
namespace {

using ::scriptbox::util::ParseTextOrDie;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Property;

TEST(BuiltinCatalogTest, ParsesAndPassesConsistencyChecks) {
  auto catalog = BuiltinCatalog();
  ASSERT_TRUE(catalog.ok()) << catalog.status();
  EXPECT_EQ(catalog->catalog_version(), "1.0.0");
  EXPECT_TRUE(CheckCatalog(*catalog).ok()) << CheckCatalog(*catalog);
  EXPECT_THAT(
      catalog->capabilities(),
      ElementsAre(
          Property(&CapabilityDescriptor::import_path,
                   "servers/search/searchProducts"),
          Property(&CapabilityDescriptor::import_path,
                   "servers/search/searchByCategory"),
          Property(&CapabilityDescriptor::import_path,
                   "servers/commerce/lookupOrder"),
          Property(&CapabilityDescriptor::import_path,
                   "servers/commerce/getProductDetails"),
          Property(&CapabilityDescriptor::import_path,
                   "servers/commerce/woocommerceOperations"),
          Property(&CapabilityDescriptor::import_path,
                   "servers/content/getCompletePageDetails")));
}

TEST(BuiltinCatalogTest, OnlyStoreOperationsHaveSideEffects) {
  auto catalog = BuiltinCatalog();
  ASSERT_TRUE(catalog.ok());
  for (const auto& descriptor : catalog->capabilities()) {
    EXPECT_EQ(descriptor.side_effects(),
              descriptor.name() == "woocommerceOperations")
        << descriptor.name();
    EXPECT_TRUE(descriptor.input_schema().fields().contains("type"))
        << descriptor.name();
  }
}

TEST(CheckCatalogTest, RejectsImportPathThatDoesNotMatchCategoryAndName) {
  auto catalog = ParseTextOrDie<CapabilityCatalog>(R"pb(
    catalog_version: "1.0.0"
    categories { name: "search" }
    capabilities {
      import_path: "servers/admin/searchProducts"
      name: "searchProducts"
      category: "search"
      description: "Search."
      version: "1.0.0"
    }
  )pb");
  EXPECT_THAT(CheckCatalog(catalog).message(),
              HasSubstr("expected 'servers/search/searchProducts'"));
}

TEST(CheckCatalogTest, RejectsDuplicatesAndBadVersions) {
  auto duplicate = ParseTextOrDie<CapabilityCatalog>(R"pb(
    catalog_version: "1.0.0"
    categories { name: "search" }
    capabilities {
      import_path: "servers/search/a"
      name: "a"
      category: "search"
      description: "A."
      version: "1.0.0"
    }
    capabilities {
      import_path: "servers/search/a"
      name: "a"
      category: "search"
      description: "A again."
      version: "1.0.1"
    }
  )pb");
  EXPECT_THAT(CheckCatalog(duplicate).message(),
              HasSubstr("listed more than once"));

  auto bad_version = ParseTextOrDie<CapabilityCatalog>(R"pb(
    catalog_version: "1.0.0"
    categories { name: "search" }
    capabilities {
      import_path: "servers/search/a"
      name: "a"
      category: "search"
      description: "A."
      version: "v1"
    }
  )pb");
  EXPECT_THAT(CheckCatalog(bad_version).message(),
              HasSubstr("expected MAJOR.MINOR.PATCH"));
}

TEST(CheckCatalogTest, RejectsUndeclaredCategory) {
  auto catalog = ParseTextOrDie<CapabilityCatalog>(R"pb(
    catalog_version: "2.1.0"
    capabilities {
      import_path: "servers/search/a"
      name: "a"
      category: "search"
      description: "A."
      version: "1.0.0"
    }
  )pb");
  EXPECT_THAT(CheckCatalog(catalog).message(),
              HasSubstr("undeclared category 'search'"));
}

}  // namespace
}  // namespace scriptbox::capability
