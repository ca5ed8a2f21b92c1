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

#include "sandbox/capability_call_handler.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "util/json.h"
#include "util/status_encoding.h"
#include "util/status_macros.h"

namespace scriptbox::sandbox {
namespace {

using ::scriptbox::util::SaveStatusToProto;

}  // namespace

CapabilityCallHandler::CapabilityCallHandler(
    const capability::CapabilityRegistry* registry,
    absl::Span<const std::string> imports,
    const context::ExecutionContext* context)
    : registry_(registry),
      imports_(imports.begin(), imports.end()),
      context_(context) {}

CapabilityReply CapabilityCallHandler::Handle(
    const CapabilityCall& call) const {
  CapabilityReply reply;
  reply.set_call_id(call.call_id());
  absl::StatusOr<std::string> output = [&]() -> absl::StatusOr<std::string> {
    if (!imports_.contains(call.import_path())) {
      return absl::PermissionDeniedError(absl::StrCat(
          "Capability ", call.import_path(), " was not imported"));
    }
    ASSIGN_OR_RETURN(google::protobuf::Value input,
                     util::ParseJsonValue(call.input_json()));
    ASSIGN_OR_RETURN(google::protobuf::Value result,
                     registry_->Invoke(call.import_path(), input, *context_));
    return util::ToJson(result);
  }();
  if (output.ok()) {
    reply.set_output_json(*std::move(output));
  } else {
    spdlog::debug("Capability {} failed for execution {}: {}",
                  call.import_path(), context_->execution_id(),
                  output.status().ToString());
  }
  SaveStatusToProto(output.status(), reply.mutable_status());
  return reply;
}

}  // namespace scriptbox::sandbox
