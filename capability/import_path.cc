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

#include "capability/import_path.h"

#include "absl/algorithm/container.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

namespace scriptbox::capability {

std::string CanonicalImportPath(absl::string_view specifier) {
  absl::ConsumePrefix(&specifier, "./");
  if (!absl::ConsumeSuffix(&specifier, ".ts")) {
    absl::ConsumeSuffix(&specifier, ".js");
  }
  return std::string(specifier);
}

std::string CapabilityImportPath(absl::string_view category,
                                 absl::string_view name) {
  return absl::StrCat(kCapabilityRoot, category, "/", name);
}

const std::vector<std::string>& RuntimeModules() {
  static const auto* modules = new std::vector<std::string>{
      "std/text", "std/collections", "std/math", "sandbox/scratch"};
  return *modules;
}

bool IsRuntimeModule(absl::string_view canonical_path) {
  return absl::c_linear_search(RuntimeModules(), canonical_path);
}

}  // namespace scriptbox::capability
