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

#ifndef CAPABILITY_CAPABILITY_DISCOVERY_H_
#define CAPABILITY_CAPABILITY_DISCOVERY_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "capability/capability_registry.h"
#include "proto/capability.pb.h"

namespace scriptbox::capability {

// Progressive disclosure over the registry: callers get import paths and
// one-line descriptions up front and full contracts only on request.
class CapabilityDiscovery {
 public:
  explicit CapabilityDiscovery(const CapabilityRegistry& registry)
      : registry_(registry) {}

  // Import paths and one-liners in catalog order, optionally restricted to
  // one category. An unknown category yields an empty list.
  std::vector<::scriptbox::CapabilitySummary> Summaries(
      absl::string_view category = "") const;

  // Prompt-ready text listing every capability by category, or only those of
  // `category` when set. Its size grows with the number of capabilities but
  // never with their schemas.
  std::string RenderListing(absl::string_view category = "") const;

  // Full contract of one capability.
  absl::StatusOr<::scriptbox::CapabilityDescriptor> Describe(
      absl::string_view import_path) const;

  // Contracts of the capabilities among `import_paths`, deduplicated and in
  // first-seen order. Runtime modules and unknown paths are skipped.
  std::vector<::scriptbox::CapabilityDescriptor> DescribeImports(
      absl::Span<const std::string> import_paths) const;

 private:
  const CapabilityRegistry& registry_;
};

}  // namespace scriptbox::capability

#endif  // CAPABILITY_CAPABILITY_DISCOVERY_H_
