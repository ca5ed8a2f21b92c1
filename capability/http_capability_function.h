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

#ifndef CAPABILITY_HTTP_CAPABILITY_FUNCTION_H_
#define CAPABILITY_HTTP_CAPABILITY_FUNCTION_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "capability/capability_function.h"
#include "capability/credential_store.h"

namespace scriptbox::capability {

// Binds a capability to a platform backend reached over HTTP. Each call is a
// POST of
//   {"input": <input>, "context": {"tenantId", "domain", "executionId"}}
// with the tenant's secret, resolved from the credential store by the
// execution's handle, as a bearer token. The response body is the result.
//
// Non-200 responses map to: 400 InvalidArgument, 401/403 PermissionDenied,
// 404 NotFound, 429/503 Unavailable, anything else Internal.
// A call never waits past the execution deadline; one that would is
// DeadlineExceeded.
class HttpCapabilityFunction : public CapabilityFunction {
 public:
  // `endpoint` is an http:// URL. `credentials` must outlive the function.
  static absl::StatusOr<std::unique_ptr<HttpCapabilityFunction>> Create(
      absl::string_view endpoint, const CredentialStore& credentials,
      absl::Duration timeout = absl::Seconds(10));

  absl::StatusOr<google::protobuf::Value> Call(
      const google::protobuf::Value& input,
      const ::scriptbox::context::ExecutionContext& context) const override;

 private:
  HttpCapabilityFunction(std::string scheme_host_port, std::string path,
                         const CredentialStore& credentials,
                         absl::Duration timeout);

  const std::string scheme_host_port_;
  const std::string path_;
  const CredentialStore& credentials_;
  const absl::Duration timeout_;
};

}  // namespace scriptbox::capability

#endif  // CAPABILITY_HTTP_CAPABILITY_FUNCTION_H_
