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

#ifndef CAPABILITY_CAPABILITY_REGISTRY_H_
#define CAPABILITY_CAPABILITY_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "capability/capability_function.h"
#include "context/execution_context.h"
#include "google/protobuf/struct.pb.h"
#include "proto/capability.pb.h"

namespace scriptbox::capability {

// Closed table of the capabilities scripts may import: the catalog entry
// (contract) and the statically bound host function for each import path.
// Built once at startup and read-only afterwards, so it can be shared by
// concurrent executions without locking.
class CapabilityRegistry {
 public:
  using FunctionMap =
      absl::flat_hash_map<std::string, std::unique_ptr<CapabilityFunction>>;

  // `functions` is keyed by canonical import path. Catalog entries without a
  // function are listed but report Unavailable when called; a function for a
  // path that is not in the catalog is an error, as is an inconsistent
  // catalog (see CheckCatalog()).
  static absl::StatusOr<std::unique_ptr<CapabilityRegistry>> Create(
      ::scriptbox::CapabilityCatalog catalog, FunctionMap functions);

  const std::string& catalog_version() const {
    return catalog_.catalog_version();
  }

  // All descriptors in catalog order.
  std::vector<const ::scriptbox::CapabilityDescriptor*> List() const;

  // Descriptors of one category in catalog order.
  std::vector<const ::scriptbox::CapabilityDescriptor*> ListCategory(
      absl::string_view category) const;

  const google::protobuf::RepeatedPtrField<::scriptbox::CapabilityCategory>&
  Categories() const {
    return catalog_.categories();
  }

  // Accepts any specifier form understood by CanonicalImportPath().
  absl::StatusOr<const ::scriptbox::CapabilityDescriptor*> Resolve(
      absl::string_view import_path) const;

  absl::StatusOr<const CapabilityFunction*> GetFunction(
      absl::string_view import_path) const;

  // Checks `input` against the input schema and the context fields the
  // capability requires, then calls the bound function. Schema violations
  // are InvalidArgument errors whose message starts with
  // "Validation failed:".
  absl::StatusOr<google::protobuf::Value> Invoke(
      absl::string_view import_path, const google::protobuf::Value& input,
      const ::scriptbox::context::ExecutionContext& context) const;

  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

 private:
  CapabilityRegistry(::scriptbox::CapabilityCatalog catalog,
                     FunctionMap functions);

  const ::scriptbox::CapabilityCatalog catalog_;
  // Points into `catalog_`.
  absl::flat_hash_map<std::string, const ::scriptbox::CapabilityDescriptor*>
      descriptors_;
  const FunctionMap functions_;
};

}  // namespace scriptbox::capability

#endif  // CAPABILITY_CAPABILITY_REGISTRY_H_
