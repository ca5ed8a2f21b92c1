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

#ifndef SANDBOX_RUNTIME_MODULES_H_
#define SANDBOX_RUNTIME_MODULES_H_

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace scriptbox::sandbox {

// Canonical path of the module backed by the scratch directory. It is
// implemented natively by the script engine.
inline constexpr absl::string_view kScratchModule = "sandbox/scratch";

// JavaScript source of a pure runtime module ("std/text", "std/collections",
// "std/math"), or nullopt for any other path.
absl::optional<absl::string_view> RuntimeModuleSource(
    absl::string_view canonical_path);

}  // namespace scriptbox::sandbox

#endif  // SANDBOX_RUNTIME_MODULES_H_
