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

#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/substitute.h"
#include "capability/import_path.h"
#include "google/protobuf/util/json_util.h"

namespace scriptbox::capability {
namespace {

using ::google::protobuf::util::JsonStringToMessage;

// Kept in proto3 JSON form so the schemas read like the JSON schemas they are.
constexpr char kBuiltinCatalogJson[] = R"json({
  "catalogVersion": "1.0.0",
  "categories": [
    {"name": "search", "description": "Find products and content in the tenant's catalog"},
    {"name": "commerce", "description": "Orders, stock, prices and store operations"},
    {"name": "content", "description": "Full page content from the tenant's website"}
  ],
  "capabilities": [
    {
      "importPath": "servers/search/searchProducts",
      "name": "searchProducts",
      "category": "search",
      "description": "Search products by free text or SKU using semantic and keyword search.",
      "version": "1.0.0",
      "requiresContext": ["domain"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "query": {"type": "string", "minLength": 1, "maxLength": 500},
          "limit": {"type": "integer", "minimum": 1, "maximum": 1000}
        },
        "required": ["query"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {
          "success": {"type": "boolean"},
          "data": {"type": "object"},
          "error": {"type": "string"}
        },
        "required": ["success"]
      },
      "examples": [
        {"description": "Find hydraulic pumps", "input": {"query": "hydraulic pump", "limit": 10}}
      ]
    },
    {
      "importPath": "servers/search/searchByCategory",
      "name": "searchByCategory",
      "category": "search",
      "description": "List products belonging to a category.",
      "version": "1.0.0",
      "requiresContext": ["domain"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "category": {"type": "string", "minLength": 1, "maxLength": 200},
          "limit": {"type": "integer", "minimum": 1, "maximum": 1000}
        },
        "required": ["category"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {"success": {"type": "boolean"}, "data": {"type": "object"}},
        "required": ["success"]
      },
      "examples": [
        {"description": "Spare parts", "input": {"category": "spare parts", "limit": 20}}
      ]
    },
    {
      "importPath": "servers/commerce/lookupOrder",
      "name": "lookupOrder",
      "category": "commerce",
      "description": "Look up an order's status, items and shipping by order id or customer email.",
      "version": "1.0.0",
      "requiresContext": ["domain", "credentials"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "orderId": {"type": "string", "minLength": 1, "maxLength": 64},
          "email": {"type": "string", "maxLength": 320}
        },
        "required": ["orderId"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {"success": {"type": "boolean"}, "data": {"type": ["object", "null"]}},
        "required": ["success"]
      }
    },
    {
      "importPath": "servers/commerce/getProductDetails",
      "name": "getProductDetails",
      "category": "commerce",
      "description": "Get price, stock, variations and specifications for one product.",
      "version": "1.0.0",
      "requiresContext": ["domain"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "productQuery": {"type": "string", "minLength": 1, "maxLength": 500},
          "includeSpecs": {"type": "boolean"}
        },
        "required": ["productQuery"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {"success": {"type": "boolean"}, "data": {"type": ["object", "null"]}},
        "required": ["success"]
      }
    },
    {
      "importPath": "servers/commerce/woocommerceOperations",
      "name": "woocommerceOperations",
      "category": "commerce",
      "description": "Run a WooCommerce store operation such as check_stock, check_order or add_to_cart.",
      "version": "1.0.0",
      "sideEffects": true,
      "requiresContext": ["domain", "credentials"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "operation": {
            "type": "string",
            "enum": [
              "check_stock", "get_stock_quantity", "get_product_details",
              "check_order", "get_shipping_info", "get_shipping_methods",
              "check_price", "get_product_variations", "get_product_categories",
              "get_product_reviews", "validate_coupon", "check_refund_status",
              "get_customer_orders", "get_order_notes", "get_payment_methods",
              "get_customer_insights", "get_low_stock_products",
              "get_sales_report", "search_products", "cancel_order",
              "add_to_cart", "get_cart", "remove_from_cart",
              "update_cart_quantity", "apply_coupon_to_cart"
            ]
          },
          "productId": {"type": "string"},
          "orderId": {"type": "string"},
          "email": {"type": "string"},
          "query": {"type": "string"},
          "categoryId": {"type": "string"},
          "couponCode": {"type": "string"},
          "cartItemKey": {"type": "string"},
          "quantity": {"type": "integer", "minimum": 1},
          "minPrice": {"type": "number", "minimum": 0},
          "maxPrice": {"type": "number", "minimum": 0},
          "page": {"type": "integer", "minimum": 1},
          "per_page": {"type": "integer", "minimum": 1, "maximum": 100},
          "threshold": {"type": "integer", "minimum": 0},
          "period": {"type": "string", "enum": ["day", "week", "month", "year"]}
        },
        "required": ["operation"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {
          "success": {"type": "boolean"},
          "data": {},
          "message": {"type": "string"},
          "currency": {"type": "string"}
        },
        "required": ["success"]
      },
      "examples": [
        {"description": "Check stock for a SKU", "input": {"operation": "check_stock", "productId": "ABC123"}}
      ]
    },
    {
      "importPath": "servers/content/getCompletePageDetails",
      "name": "getCompletePageDetails",
      "category": "content",
      "description": "Fetch every indexed chunk of one page of the tenant's website.",
      "version": "1.0.0",
      "requiresContext": ["domain"],
      "inputSchema": {
        "type": "object",
        "properties": {
          "pageQuery": {"type": "string", "minLength": 1, "maxLength": 500}
        },
        "required": ["pageQuery"],
        "additionalProperties": false
      },
      "outputSchema": {
        "type": "object",
        "properties": {"success": {"type": "boolean"}, "data": {"type": ["object", "null"]}},
        "required": ["success"]
      }
    }
  ]
})json";

bool IsSemanticVersion(absl::string_view version) {
  std::vector<absl::string_view> parts = absl::StrSplit(version, '.');
  if (parts.size() != 3) {
    return false;
  }
  for (absl::string_view part : parts) {
    if (part.empty()) {
      return false;
    }
    for (char c : part) {
      if (!absl::ascii_isdigit(c)) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

absl::StatusOr<::scriptbox::CapabilityCatalog> BuiltinCatalog() {
  ::scriptbox::CapabilityCatalog catalog;
  const google::protobuf::util::Status status =
      JsonStringToMessage(kBuiltinCatalogJson, &catalog);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat(
        "Built-in capability catalog is malformed: ",
        status.message().ToString()));
  }
  return catalog;
}

absl::Status CheckCatalog(const ::scriptbox::CapabilityCatalog& catalog) {
  if (!IsSemanticVersion(catalog.catalog_version())) {
    return absl::InvalidArgumentError(absl::Substitute(
        "Catalog version '$0' is not MAJOR.MINOR.PATCH.",
        catalog.catalog_version()));
  }
  absl::flat_hash_set<std::string> categories;
  for (const auto& category : catalog.categories()) {
    if (!categories.insert(category.name()).second) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Category '$0' declared more than once.", category.name()));
    }
  }
  absl::flat_hash_set<std::string> import_paths;
  for (const auto& descriptor : catalog.capabilities()) {
    if (descriptor.name().empty()) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Capability '$0' has no name.", descriptor.import_path()));
    }
    if (!categories.contains(descriptor.category())) {
      return absl::InvalidArgumentError(
          absl::Substitute("Capability '$0' uses undeclared category '$1'.",
                           descriptor.name(), descriptor.category()));
    }
    if (descriptor.import_path() !=
        CapabilityImportPath(descriptor.category(), descriptor.name())) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Capability '$0' has import path '$1'; expected '$2'.",
          descriptor.name(), descriptor.import_path(),
          CapabilityImportPath(descriptor.category(), descriptor.name())));
    }
    if (descriptor.description().empty() ||
        absl::StrContains(descriptor.description(), '\n')) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Capability '$0' needs a one-line description.",
          descriptor.import_path()));
    }
    if (!IsSemanticVersion(descriptor.version())) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Capability '$0' has version '$1'; expected MAJOR.MINOR.PATCH.",
          descriptor.import_path(), descriptor.version()));
    }
    if (!import_paths.insert(descriptor.import_path()).second) {
      return absl::InvalidArgumentError(
          absl::Substitute("Capability '$0' is listed more than once.",
                           descriptor.import_path()));
    }
  }
  return absl::OkStatus();
}

}  // namespace scriptbox::capability
