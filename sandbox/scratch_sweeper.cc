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

#include "sandbox/scratch_sweeper.h"

#include <sys/stat.h>

#include <utility>
#include <vector>

#include "absl/time/clock.h"
#include "sandboxed_api/util/fileops.h"
#include "sandboxed_api/util/path.h"
#include "spdlog/spdlog.h"

namespace scriptbox::sandbox {
namespace {

namespace fileops = ::sapi::file_util::fileops;

std::vector<std::string> ListSubdirectories(const std::string& directory) {
  std::vector<std::string> entries;
  std::string error;
  if (!fileops::ListDirectoryEntries(directory, &entries, &error)) {
    spdlog::debug("Unable to list {}: {}", directory, error);
    return {};
  }
  std::vector<std::string> subdirectories;
  for (const std::string& entry : entries) {
    std::string path = sapi::file::JoinPath(directory, entry);
    struct stat info;
    if (lstat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode)) {
      subdirectories.push_back(std::move(path));
    }
  }
  return subdirectories;
}

}  // namespace

ScratchSweeper::ScratchSweeper(
    std::string scratch_root, absl::Duration max_age, absl::Duration interval,
    const util::PeriodicFunctionFactory& periodic_function_factory)
    : scratch_root_(std::move(scratch_root)), max_age_(max_age) {
  periodic_sweep_ = periodic_function_factory(
      [this]() { SweepOnce(absl::Now()); }, interval, interval);
}

int ScratchSweeper::SweepOnce(absl::Time now) const {
  int removed = 0;
  for (const std::string& tenant_dir : ListSubdirectories(scratch_root_)) {
    for (const std::string& execution_dir : ListSubdirectories(tenant_dir)) {
      struct stat info;
      if (stat(execution_dir.c_str(), &info) != 0 ||
          absl::FromTimeT(info.st_mtime) > now - max_age_) {
        continue;
      }
      if (fileops::DeleteRecursively(execution_dir)) {
        ++removed;
      } else {
        spdlog::warn("Unable to remove expired scratch directory {}",
                     execution_dir);
      }
    }
  }
  if (removed > 0) {
    spdlog::info("Removed {} expired scratch directories", removed);
  }
  return removed;
}

}  // namespace scriptbox::sandbox
