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

#ifndef UTIL_PARSE_PROTO_H_
#define UTIL_PARSE_PROTO_H_

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/text_format.h"

namespace scriptbox {
namespace util {

/// Parses text-format `input` into a message of type `T`.
template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view input) {
  T result;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(input),
                                                     &result)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Unable to parse text proto of type ", T::descriptor()->full_name()));
  }
  return result;
}

/// Test helper: like ParseTextProto() but aborts on malformed input.
template <typename T>
T ParseTextOrDie(absl::string_view input) {
  absl::StatusOr<T> result = ParseTextProto<T>(input);
  if (!result.ok()) {
    std::cerr << result.status().ToString() << std::endl;
    std::abort();
  }
  return *std::move(result);
}

}  // namespace util
}  // namespace scriptbox

#endif  // UTIL_PARSE_PROTO_H_
