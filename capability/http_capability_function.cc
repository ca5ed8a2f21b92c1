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

#include "capability/http_capability_function.h"

#include <algorithm>
#include <regex>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "google/protobuf/struct.pb.h"
#include "httplib.h"
#include "spdlog/spdlog.h"
#include "util/json.h"
#include "util/status_macros.h"

namespace scriptbox::capability {
namespace {

using ::google::protobuf::Struct;
using ::google::protobuf::Value;
using ::scriptbox::context::ExecutionContext;

constexpr size_t kMaxErrorBodyExcerpt = 256;

absl::StatusOr<Value> TranslateResponse(const httplib::Response& response) {
  switch (response.status) {
    case 200:
      return ::scriptbox::util::ParseJsonValue(response.body);
    case 400:
      return absl::InvalidArgumentError(absl::StrCat(
          "The capability backend rejected the input: ",
          response.body.substr(0, kMaxErrorBodyExcerpt)));
    case 401:
    case 403:
      return absl::PermissionDeniedError(absl::StrCat(
          "Unauthenticated or unauthorized request. HTTP status code: ",
          response.status));
    case 404:
      return absl::NotFoundError("The capability backend found no resource.");
    case 429:
    case 503:
      return absl::UnavailableError(absl::StrCat(
          "The capability backend is unavailable. HTTP status code: ",
          response.status));
    default:
      return absl::InternalError(absl::StrCat(
          "The capability backend failed. HTTP status code: ",
          response.status));
  }
}

Struct RequestBody(const Value& input, const ExecutionContext& context) {
  Struct body;
  (*body.mutable_fields())["input"] = input;
  auto& context_fields =
      *(*body.mutable_fields())["context"].mutable_struct_value()
           ->mutable_fields();
  context_fields["tenantId"].set_string_value(context.tenant_id());
  context_fields["domain"].set_string_value(context.domain());
  context_fields["executionId"].set_string_value(context.execution_id());
  return body;
}

}  // namespace

absl::StatusOr<std::unique_ptr<HttpCapabilityFunction>>
HttpCapabilityFunction::Create(absl::string_view endpoint,
                               const CredentialStore& credentials,
                               absl::Duration timeout) {
  // Splits a well-formed URL into scheme-host-port and path.
  static const std::regex url_re(
      // Scheme, host and port (1)
      "^("
      // Scheme (2)
      "([a-z]+)://"
      // Host
      "[^:/?#]+"
      // Port
      R"((?::\d+)?)"
      ")"
      // Path (3)
      "(/.*)?$");
  std::smatch m;
  const std::string url(endpoint);
  if (!std::regex_match(url, m, url_re)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a valid capability endpoint URL: ", endpoint));
  }
  if (m[2].str() != "http") {
    return absl::InvalidArgumentError(absl::StrCat(
        "Only http:// capability endpoints are supported: ", endpoint));
  }
  std::string path = m[3].matched ? m[3].str() : "/";
  return absl::WrapUnique(new HttpCapabilityFunction(
      m[1].str(), std::move(path), credentials, timeout));
}

HttpCapabilityFunction::HttpCapabilityFunction(
    std::string scheme_host_port, std::string path,
    const CredentialStore& credentials, absl::Duration timeout)
    : scheme_host_port_(std::move(scheme_host_port)),
      path_(std::move(path)),
      credentials_(credentials),
      timeout_(timeout) {}

absl::StatusOr<Value> HttpCapabilityFunction::Call(
    const Value& input, const ExecutionContext& context) const {
  ASSIGN_OR_RETURN(std::string secret,
                   credentials_.Resolve(context.credential_handle()));
  ASSIGN_OR_RETURN(std::string body,
                   ::scriptbox::util::ToJson(RequestBody(input, context)));

  // The call may not outlive the execution it serves.
  const absl::Duration timeout =
      std::min(timeout_, context.TimeRemaining(absl::Now()));
  if (timeout <= absl::ZeroDuration()) {
    return absl::DeadlineExceededError(
        "The execution deadline passed before the capability was called.");
  }
  httplib::Client client(scheme_host_port_);
  const int64_t timeout_us = absl::ToInt64Microseconds(timeout);
  client.set_connection_timeout(timeout_us / 1'000'000, timeout_us % 1'000'000);
  client.set_read_timeout(timeout_us / 1'000'000, timeout_us % 1'000'000);
  client.set_write_timeout(timeout_us / 1'000'000, timeout_us % 1'000'000);
  const httplib::Headers headers = {
      {"Authorization", absl::StrCat("Bearer ", secret)},
      {"X-Tenant-Id", context.tenant_id()},
      {"X-Scriptbox-Domain", context.domain()},
      {"X-Scriptbox-Execution-Id", context.execution_id()},
  };
  auto response = client.Post(path_, headers, body, "application/json");
  if (!response) {
    if (context.TimeRemaining(absl::Now()) <= absl::ZeroDuration()) {
      return absl::DeadlineExceededError(
          "The execution deadline passed while waiting for the capability "
          "backend.");
    }
    spdlog::warn("Capability backend {}{} unreachable: {}", scheme_host_port_,
                 path_, httplib::to_string(response.error()));
    return absl::UnavailableError("Unable to reach the capability backend.");
  }
  return TranslateResponse(*response);
}

}  // namespace scriptbox::capability
