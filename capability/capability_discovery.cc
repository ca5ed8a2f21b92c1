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

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "util/status_macros.h"

namespace scriptbox::capability {
namespace {

using ::scriptbox::CapabilityDescriptor;
using ::scriptbox::CapabilitySummary;

CapabilitySummary Summarize(const CapabilityDescriptor& descriptor) {
  CapabilitySummary summary;
  summary.set_import_path(descriptor.import_path());
  summary.set_description(descriptor.description());
  return summary;
}

}  // namespace

std::vector<CapabilitySummary> CapabilityDiscovery::Summaries(
    absl::string_view category) const {
  std::vector<CapabilitySummary> summaries;
  for (const CapabilityDescriptor* descriptor :
       category.empty() ? registry_.List() : registry_.ListCategory(category)) {
    summaries.push_back(Summarize(*descriptor));
  }
  return summaries;
}

std::string CapabilityDiscovery::RenderListing(
    absl::string_view category_filter) const {
  std::string listing = absl::Substitute(
      "Available capabilities (catalog $0). Import one with\n"
      "  import { name } from './servers/<category>/<name>';\n"
      "Each export is an async function taking one input object. Call\n"
      "DescribeCapability for a full input/output schema.\n",
      registry_.catalog_version());
  for (const auto& category : registry_.Categories()) {
    if (!category_filter.empty() && category.name() != category_filter) {
      continue;
    }
    const auto descriptors = registry_.ListCategory(category.name());
    if (descriptors.empty()) {
      continue;
    }
    absl::StrAppend(&listing, "\n", category.name(), ": ",
                    category.description(), "\n");
    for (const CapabilityDescriptor* descriptor : descriptors) {
      absl::StrAppend(&listing, "  ./", descriptor->import_path(), " - ",
                      descriptor->description(), "\n");
    }
  }
  return listing;
}

absl::StatusOr<CapabilityDescriptor> CapabilityDiscovery::Describe(
    absl::string_view import_path) const {
  ASSIGN_OR_RETURN(const CapabilityDescriptor* descriptor,
                   registry_.Resolve(import_path));
  return *descriptor;
}

std::vector<CapabilityDescriptor> CapabilityDiscovery::DescribeImports(
    absl::Span<const std::string> import_paths) const {
  std::vector<CapabilityDescriptor> descriptors;
  absl::flat_hash_set<std::string> seen;
  for (const std::string& import_path : import_paths) {
    auto descriptor = registry_.Resolve(import_path);
    if (!descriptor.ok() ||
        !seen.insert((*descriptor)->import_path()).second) {
      continue;
    }
    descriptors.push_back(**descriptor);
  }
  return descriptors;
}

}  // namespace scriptbox::capability
