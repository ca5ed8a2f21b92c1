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

#ifndef UTIL_STATUS_MACROS_H_
#define UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace scriptbox {
namespace internal {

inline const absl::Status& AsStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& AsStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace internal
}  // namespace scriptbox

/// Returns from the current function if `expr`, an `absl::Status` or an
/// `absl::StatusOr<T>`, is not OK. A `StatusOr` is reduced to its status.
///
/// ```
///   absl::Status PrepareAndRun() {
///     RETURN_IF_ERROR(Prepare());
///     RETURN_IF_ERROR(Run());
///     return absl::OkStatus();
///   }
/// ```
#define RETURN_IF_ERROR(expr)                                          \
  do {                                                                 \
    const auto& _scriptbox_status_to_verify = (expr);                  \
    if (ABSL_PREDICT_FALSE(!_scriptbox_status_to_verify.ok())) {       \
      return ::scriptbox::internal::AsStatus(                          \
          _scriptbox_status_to_verify);                                \
    }                                                                  \
  } while (false)

/// Evaluates `rexpr`, an `absl::StatusOr<T>`. On error returns its status from
/// the current function, otherwise moves the value into `lhs`. `lhs` may
/// declare a new variable:
///
/// ```
///   ASSIGN_OR_RETURN(auto descriptor, registry.Resolve(import_path));
///   ASSIGN_OR_RETURN(std::unique_ptr<Foo> foo, Foo::Create());
/// ```
#define ASSIGN_OR_RETURN(lhs, rexpr)                                         \
  SCRIPTBOX_ASSIGN_OR_RETURN_IMPL_(                                          \
      SCRIPTBOX_STATUS_MACROS_CONCAT_(_scriptbox_status_or, __LINE__), lhs, \
      rexpr)

#define SCRIPTBOX_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                     \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                    \
    return std::move(statusor).status();                       \
  }                                                            \
  lhs = std::move(statusor).value()

#define SCRIPTBOX_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define SCRIPTBOX_STATUS_MACROS_CONCAT_(x, y) \
  SCRIPTBOX_STATUS_MACROS_CONCAT_INNER_(x, y)

#endif  // UTIL_STATUS_MACROS_H_
