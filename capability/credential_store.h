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

#ifndef CAPABILITY_CREDENTIAL_STORE_H_
#define CAPABILITY_CREDENTIAL_STORE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace scriptbox::capability {

// How one credential handle is provisioned. Exactly one of `secret` and
// `secret_env` is expected; `secret_env` names an environment variable of
// the server process.
struct CredentialSpecification {
  std::string handle;
  std::string secret;
  std::string secret_env;
};

// Resolves opaque credential handles to platform secrets on the host. The
// sandbox only ever sees handles.
class CredentialStore {
 public:
  explicit CredentialStore(
      absl::flat_hash_map<std::string, std::string> secrets_by_handle);

  // Resolves every specification eagerly. Fails if a handle is repeated or a
  // referenced environment variable is unset or empty.
  static absl::StatusOr<std::unique_ptr<CredentialStore>> Create(
      const std::vector<CredentialSpecification>& specifications);

  // Returns Unauthenticated for an empty handle and NotFound for an unknown
  // one.
  absl::StatusOr<std::string> Resolve(absl::string_view handle) const;

  // Raw secret values, for redaction of anything returned to callers.
  std::vector<std::string> Secrets() const;

  CredentialStore(const CredentialStore&) = delete;
  CredentialStore& operator=(const CredentialStore&) = delete;

 private:
  const absl::flat_hash_map<std::string, std::string> secrets_by_handle_;
};

}  // namespace scriptbox::capability

#endif  // CAPABILITY_CREDENTIAL_STORE_H_
