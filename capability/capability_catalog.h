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

#ifndef CAPABILITY_CAPABILITY_CATALOG_H_
#define CAPABILITY_CAPABILITY_CATALOG_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "proto/capability.pb.h"

namespace scriptbox::capability {

// The versioned catalog of capabilities compiled into this binary.
absl::StatusOr<::scriptbox::CapabilityCatalog> BuiltinCatalog();

// Checks catalog consistency: every capability has a name, a declared
// category, an import path of the form servers/<category>/<name>, a one-line
// description and a MAJOR.MINOR.PATCH version, and import paths are unique.
absl::Status CheckCatalog(const ::scriptbox::CapabilityCatalog& catalog);

}  // namespace scriptbox::capability

#endif  // CAPABILITY_CAPABILITY_CATALOG_H_
