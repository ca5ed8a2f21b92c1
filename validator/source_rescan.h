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

#ifndef VALIDATOR_SOURCE_RESCAN_H_
#define VALIDATOR_SOURCE_RESCAN_H_

#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace scriptbox::validator {

// Decodes \x, \u and \u{} escapes anywhere in `source`, then repeatedly
// joins adjacent string pieces ('ev' + 'al', "ev", "al", `${'ev'}${'al'}`)
// until nothing changes.
std::string NormalizeSource(absl::string_view source);

// Scans the normalized form of the whole raw source, comments included, for
// banned words. Some words only count when they make up a whole quoted
// string, so that ordinary prose and class constructors pass.
absl::optional<std::string> FindBannedWord(absl::string_view source);

}  // namespace scriptbox::validator

#endif  // VALIDATOR_SOURCE_RESCAN_H_
