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

#include "context/execution_context.h"

#include <algorithm>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/substitute.h"

namespace scriptbox::context {
namespace {
constexpr size_t kMaxTenantPathLength = 64;
}  // namespace

absl::Duration ExecutionContext::TimeRemaining(absl::Time now) const {
  return std::max(deadline_ - now, absl::ZeroDuration());
}

std::string SanitizeTenantForPath(absl::string_view tenant_id) {
  std::string sanitized;
  sanitized.reserve(std::min(tenant_id.size(), kMaxTenantPathLength));
  for (char c : tenant_id.substr(0, kMaxTenantPathLength)) {
    sanitized.push_back(absl::ascii_isalnum(c) || c == '-' || c == '_' ? c
                                                                       : '_');
  }
  // "." and ".." are not reachable since '.' is replaced.
  return sanitized;
}

ExecutionContextBuilder::ExecutionContextBuilder(
    ExecutionContextOptions options)
    : options_(std::move(options)) {}

std::string ExecutionContextBuilder::NewExecutionId() const {
  absl::MutexLock lock(&bitgen_mutex_);
  return absl::StrFormat("%016x%016x", absl::Uniform<uint64_t>(bitgen_),
                         absl::Uniform<uint64_t>(bitgen_));
}

absl::StatusOr<ExecutionContext> ExecutionContextBuilder::Build(
    absl::string_view tenant_id, absl::string_view domain,
    absl::string_view credential_handle, int64_t time_budget_ms,
    absl::Time submitted_at) const {
  if (tenant_id.empty()) {
    return absl::InvalidArgumentError("tenant_id must not be empty.");
  }
  if (domain.empty()) {
    return absl::InvalidArgumentError("domain must not be empty.");
  }
  ExecutionContext context;
  if (time_budget_ms <= 0) {
    context.time_budget_ = options_.default_time_budget;
  } else if (absl::Milliseconds(time_budget_ms) > options_.max_time_budget) {
    context.time_budget_ = options_.max_time_budget;
    context.diagnostics_.push_back(absl::Substitute(
        "Time budget of $0ms exceeds the platform maximum; clamped to $1ms.",
        time_budget_ms, absl::ToInt64Milliseconds(options_.max_time_budget)));
  } else {
    context.time_budget_ = absl::Milliseconds(time_budget_ms);
  }
  context.execution_id_ = NewExecutionId();
  context.tenant_id_ = std::string(tenant_id);
  context.domain_ = std::string(domain);
  context.credential_handle_ = std::string(credential_handle);
  context.scratch_dir_ =
      absl::StrCat(options_.scratch_root, "/", SanitizeTenantForPath(tenant_id),
                   "/", context.execution_id_);
  context.submitted_at_ = submitted_at;
  context.deadline_ = submitted_at + context.time_budget_;
  return context;
}

}  // namespace scriptbox::context
