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

#include "util/json.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/util/json_util.h"

namespace scriptbox::util {
namespace {

using ::google::protobuf::util::JsonStringToMessage;
using ::google::protobuf::util::MessageToJsonString;

template <typename T>
absl::StatusOr<T> ParseJson(absl::string_view json) {
  T message;
  const google::protobuf::util::Status status =
      JsonStringToMessage(std::string(json), &message);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid JSON: ", status.message().ToString()));
  }
  return message;
}

}  // namespace

absl::StatusOr<google::protobuf::Value> ParseJsonValue(absl::string_view json) {
  return ParseJson<google::protobuf::Value>(json);
}

absl::StatusOr<google::protobuf::Struct> ParseJsonObject(
    absl::string_view json) {
  return ParseJson<google::protobuf::Struct>(json);
}

absl::StatusOr<std::string> ToJson(const google::protobuf::Message& message) {
  std::string json;
  const google::protobuf::util::Status status =
      MessageToJsonString(message, &json);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat("Unable to serialize to JSON: ",
                                            status.message().ToString()));
  }
  return json;
}

}  // namespace scriptbox::util
