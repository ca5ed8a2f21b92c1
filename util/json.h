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

#ifndef UTIL_JSON_H_
#define UTIL_JSON_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"

namespace scriptbox::util {

// Parses any JSON text (object, array, scalar) into a Value. Returns
// InvalidArgument on malformed input.
absl::StatusOr<google::protobuf::Value> ParseJsonValue(absl::string_view json);

// Parses a JSON object into a Struct.
absl::StatusOr<google::protobuf::Struct> ParseJsonObject(
    absl::string_view json);

// Serializes a message to compact JSON using proto3 JSON mapping.
absl::StatusOr<std::string> ToJson(const google::protobuf::Message& message);

}  // namespace scriptbox::util

#endif  // UTIL_JSON_H_
