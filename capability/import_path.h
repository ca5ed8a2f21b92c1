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

#ifndef CAPABILITY_IMPORT_PATH_H_
#define CAPABILITY_IMPORT_PATH_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace scriptbox::capability {

// Prefix shared by every capability import path.
inline constexpr absl::string_view kCapabilityRoot = "servers/";

// Canonical form of a module specifier as written in a script: a single
// leading "./" and a trailing ".ts" or ".js" are dropped, so
// "./servers/search/searchProducts.ts" becomes
// "servers/search/searchProducts". Anything else is returned unchanged.
std::string CanonicalImportPath(absl::string_view specifier);

// Builds "servers/<category>/<name>".
std::string CapabilityImportPath(absl::string_view category,
                                 absl::string_view name);

// Modules implemented by the script runtime itself rather than by a
// capability backend: pure helpers and the scratch directory API.
const std::vector<std::string>& RuntimeModules();

bool IsRuntimeModule(absl::string_view canonical_path);

}  // namespace scriptbox::capability

#endif  // CAPABILITY_IMPORT_PATH_H_
