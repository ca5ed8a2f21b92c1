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

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scriptbox::capability {
namespace {

using ::testing::UnorderedElementsAre;

TEST(CredentialStoreTest, ResolvesInlineAndEnvironmentSecrets) {
  setenv("SCRIPTBOX_TEST_SECRET", "from-env", /*overwrite=*/1);
  auto store = CredentialStore::Create(
      {{.handle = "inline", .secret = "s3cr3t"},
       {.handle = "env", .secret_env = "SCRIPTBOX_TEST_SECRET"}});
  ASSERT_TRUE(store.ok()) << store.status();
  EXPECT_EQ((*store)->Resolve("inline").value(), "s3cr3t");
  EXPECT_EQ((*store)->Resolve("env").value(), "from-env");
  EXPECT_THAT((*store)->Secrets(), UnorderedElementsAre("s3cr3t", "from-env"));
}

TEST(CredentialStoreTest, UnknownAndEmptyHandles) {
  CredentialStore store(
      absl::flat_hash_map<std::string, std::string>{{"known", "value"}});
  EXPECT_EQ(store.Resolve("other").status().code(),
            absl::StatusCode::kNotFound);
  EXPECT_EQ(store.Resolve("").status().code(),
            absl::StatusCode::kUnauthenticated);
}

TEST(CredentialStoreTest, RejectsUnsetEnvironmentVariable) {
  unsetenv("SCRIPTBOX_TEST_MISSING");
  auto store = CredentialStore::Create(
      {{.handle = "h", .secret_env = "SCRIPTBOX_TEST_MISSING"}});
  EXPECT_EQ(store.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(CredentialStoreTest, RejectsDuplicateHandles) {
  auto store = CredentialStore::Create(
      {{.handle = "h", .secret = "a"}, {.handle = "h", .secret = "b"}});
  EXPECT_EQ(store.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace scriptbox::capability
