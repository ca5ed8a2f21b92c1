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

#ifndef VALIDATOR_PATTERN_SCAN_H_
#define VALIDATOR_PATTERN_SCAN_H_

#include <string>

#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "validator/script_lexer.h"

namespace scriptbox::validator {

// Deny-list classes.
inline constexpr char kDynamicEvaluation[] = "dynamic_evaluation";
inline constexpr char kFilesystem[] = "filesystem";
inline constexpr char kProcessControl[] = "process_control";
inline constexpr char kNetwork[] = "network";
inline constexpr char kReflection[] = "reflection";
inline constexpr char kResourceAbuse[] = "resource_abuse";

struct PatternMatch {
  std::string pattern_class;
  // The construct that matched, e.g. "eval" or "['constructor']".
  std::string construct;
  int line = 0;
};

// Returns the first deny-listed construct in `tokens`, if any. Identifiers
// are matched as free references (`eval`), as member accesses (`x.callee`)
// or both, depending on the rule. Computed member access with literal keys
// (`x['con' + 'structor']`) is treated like the equivalent dotted access.
absl::optional<PatternMatch> FindDeniedPattern(absl::Span<const Token> tokens);

}  // namespace scriptbox::validator

#endif  // VALIDATOR_PATTERN_SCAN_H_
