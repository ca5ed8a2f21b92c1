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

#include "capability/credential_store.h"

#include <cstdlib>
#include <memory>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/substitute.h"

namespace scriptbox::capability {

CredentialStore::CredentialStore(
    absl::flat_hash_map<std::string, std::string> secrets_by_handle)
    : secrets_by_handle_(std::move(secrets_by_handle)) {}

absl::StatusOr<std::unique_ptr<CredentialStore>> CredentialStore::Create(
    const std::vector<CredentialSpecification>& specifications) {
  absl::flat_hash_map<std::string, std::string> secrets_by_handle;
  for (const auto& specification : specifications) {
    if (specification.handle.empty()) {
      return absl::InvalidArgumentError("Credential handle must not be empty.");
    }
    std::string secret = specification.secret;
    if (!specification.secret_env.empty()) {
      const char* value = std::getenv(specification.secret_env.c_str());
      if (value == nullptr || *value == '\0') {
        return absl::FailedPreconditionError(absl::Substitute(
            "Environment variable $0 for credential '$1' is not set.",
            specification.secret_env, specification.handle));
      }
      secret = value;
    }
    if (secret.empty()) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Credential '$0' has no secret.", specification.handle));
    }
    if (!secrets_by_handle.insert({specification.handle, std::move(secret)})
             .second) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Credential '$0' defined more than once in the configuration file.",
          specification.handle));
    }
  }
  return std::make_unique<CredentialStore>(std::move(secrets_by_handle));
}

absl::StatusOr<std::string> CredentialStore::Resolve(
    absl::string_view handle) const {
  if (handle.empty()) {
    return absl::UnauthenticatedError(
        "The execution carries no credential handle.");
  }
  const auto it = secrets_by_handle_.find(handle);
  if (it == secrets_by_handle_.end()) {
    return absl::NotFoundError(
        absl::Substitute("Unknown credential handle '$0'.", handle));
  }
  return it->second;
}

std::vector<std::string> CredentialStore::Secrets() const {
  std::vector<std::string> secrets;
  secrets.reserve(secrets_by_handle_.size());
  for (const auto& [handle, secret] : secrets_by_handle_) {
    secrets.push_back(secret);
  }
  return secrets;
}

}  // namespace scriptbox::capability
