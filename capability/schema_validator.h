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

#ifndef CAPABILITY_SCHEMA_VALIDATOR_H_
#define CAPABILITY_SCHEMA_VALIDATOR_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"

namespace scriptbox::capability {

// Checks `value` against a JSON-schema-like `schema`. Supported keywords:
// type, enum, properties, required, additionalProperties (false only),
// items, minItems, maxItems, minLength, maxLength, minimum, maximum. Other
// keywords (description, default, ...) are ignored.
//
// Returns InvalidArgument naming the first offending location, e.g.
// "input.items[2].price: expected number, got string". `root` names the
// top-level value in messages.
absl::Status ValidateAgainstSchema(const google::protobuf::Value& value,
                                   const google::protobuf::Struct& schema,
                                   absl::string_view root = "input");

}  // namespace scriptbox::capability

#endif  // CAPABILITY_SCHEMA_VALIDATOR_H_
