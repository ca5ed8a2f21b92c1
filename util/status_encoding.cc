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

#include "util/status_encoding.h"

#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"

namespace scriptbox {
namespace util {
namespace {

constexpr int kMaxCanonicalCode =
    static_cast<int>(absl::StatusCode::kUnauthenticated);

}  // namespace

void SaveStatusToProto(const absl::Status& status, StatusProto* proto) {
  proto->Clear();
  proto->set_code(status.raw_code());
  if (!status.message().empty()) {
    proto->set_message(std::string(status.message()));
  }
  status.ForEachPayload(
      [proto](absl::string_view type_url, const absl::Cord& payload) {
        google::protobuf::Any* any = proto->add_details();
        any->set_type_url(std::string(type_url));
        any->set_value(std::string(payload));
      });
}

absl::Status StatusFromProto(const StatusProto& proto) {
  if (proto.code() == 0) {
    return absl::OkStatus();
  }
  const absl::StatusCode code =
      proto.code() > 0 && proto.code() <= kMaxCanonicalCode
          ? static_cast<absl::StatusCode>(proto.code())
          : absl::StatusCode::kUnknown;
  absl::Status status(code, proto.message());
  for (const auto& detail : proto.details()) {
    status.SetPayload(detail.type_url(), absl::Cord(detail.value()));
  }
  return status;
}

}  // namespace util
}  // namespace scriptbox
