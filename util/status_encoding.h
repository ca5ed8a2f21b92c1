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

#ifndef UTIL_STATUS_ENCODING_H_
#define UTIL_STATUS_ENCODING_H_

#include "absl/status/status.h"
#include "util/status.pb.h"

namespace scriptbox {
namespace util {

// Serializes `status`, including its payloads, into `proto`.
void SaveStatusToProto(const absl::Status& status, StatusProto* proto);

// Inverse of SaveStatusToProto(). Codes outside the canonical absl range are
// decoded as kUnknown.
absl::Status StatusFromProto(const StatusProto& proto);

}  // namespace util
}  // namespace scriptbox

#endif  // UTIL_STATUS_ENCODING_H_
