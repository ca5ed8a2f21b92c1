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

#ifndef VALIDATOR_SCRIPT_VALIDATOR_H_
#define VALIDATOR_SCRIPT_VALIDATOR_H_

#include <cstddef>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"
#include "proto/scriptbox.pb.h"

namespace scriptbox::validator {

struct ValidatorOptions {
  // Larger sources fail the syntax stage without being compiled.
  size_t max_source_bytes = 64 * 1024;
};

// Four-stage static check of a script, run before anything is spawned:
// syntax (V8 module compilation, nothing is evaluated), imports, deny-listed
// patterns in the token stream, and a full rescan of the normalized raw
// source. Stops at the first failing stage. V8 must have been initialized
// (see V8PlatformInitializer) before Validate() is called.
class ScriptValidator {
 public:
  explicit ScriptValidator(const ValidatorOptions& options);

  // `allowed_capabilities` holds canonical capability import paths; runtime
  // modules are always allowed. Never fails: problems are reported in the
  // returned ValidationResult.
  ValidationResult Validate(
      absl::string_view source,
      const absl::flat_hash_set<std::string>& allowed_capabilities) const;

 private:
  const ValidatorOptions options_;
};

}  // namespace scriptbox::validator

#endif  // VALIDATOR_SCRIPT_VALIDATOR_H_
