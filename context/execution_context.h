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

#ifndef CONTEXT_EXECUTION_CONTEXT_H_
#define CONTEXT_EXECUTION_CONTEXT_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/random/random.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace scriptbox::context {

// Per-execution bundle of tenant identity, credential handle, scratch
// location and deadline. Created by ExecutionContextBuilder for exactly one
// request and owned by whoever runs that request; it cannot be copied.
class ExecutionContext {
 public:
  ExecutionContext(ExecutionContext&&) = default;
  ExecutionContext& operator=(ExecutionContext&&) = default;
  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;

  const std::string& execution_id() const { return execution_id_; }
  const std::string& tenant_id() const { return tenant_id_; }
  const std::string& domain() const { return domain_; }
  // Opaque reference resolved by capability backends on the host. Never the
  // secret itself.
  const std::string& credential_handle() const { return credential_handle_; }
  // Host path of the private scratch directory. Not created by the builder.
  const std::string& scratch_dir() const { return scratch_dir_; }
  absl::Time submitted_at() const { return submitted_at_; }
  absl::Duration time_budget() const { return time_budget_; }
  absl::Time deadline() const { return deadline_; }
  // Notes produced while building, e.g. a clamped time budget.
  const std::vector<std::string>& diagnostics() const { return diagnostics_; }

  // Time left until the deadline, never negative.
  absl::Duration TimeRemaining(absl::Time now) const;

 private:
  friend class ExecutionContextBuilder;
  ExecutionContext() = default;

  std::string execution_id_;
  std::string tenant_id_;
  std::string domain_;
  std::string credential_handle_;
  std::string scratch_dir_;
  absl::Time submitted_at_;
  absl::Duration time_budget_;
  absl::Time deadline_;
  std::vector<std::string> diagnostics_;
};

struct ExecutionContextOptions {
  absl::Duration default_time_budget = absl::Seconds(30);
  // Hard platform ceiling; larger requests are clamped.
  absl::Duration max_time_budget = absl::Seconds(60);
  std::string scratch_root = "/tmp/scriptbox";
};

class ExecutionContextBuilder {
 public:
  explicit ExecutionContextBuilder(ExecutionContextOptions options);

  // Builds a fresh context. Performs no I/O. Returns InvalidArgument when the
  // tenant or domain is empty. A non-positive budget selects the default
  // budget; a budget above the ceiling is clamped and the clamp is noted in
  // the context diagnostics.
  absl::StatusOr<ExecutionContext> Build(absl::string_view tenant_id,
                                         absl::string_view domain,
                                         absl::string_view credential_handle,
                                         int64_t time_budget_ms,
                                         absl::Time submitted_at) const;

  const ExecutionContextOptions& options() const { return options_; }

  ExecutionContextBuilder(const ExecutionContextBuilder&) = delete;
  ExecutionContextBuilder& operator=(const ExecutionContextBuilder&) = delete;

 private:
  std::string NewExecutionId() const ABSL_LOCKS_EXCLUDED(bitgen_mutex_);

  const ExecutionContextOptions options_;
  mutable absl::Mutex bitgen_mutex_;
  mutable absl::BitGen bitgen_ ABSL_GUARDED_BY(bitgen_mutex_);
};

// Maps a tenant id onto a single safe path component.
std::string SanitizeTenantForPath(absl::string_view tenant_id);

}  // namespace scriptbox::context

#endif  // CONTEXT_EXECUTION_CONTEXT_H_
