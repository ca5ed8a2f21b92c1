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

#include "sandbox/sandbox_executor.h"

#include <signal.h>
#include <stdlib.h>

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "absl/time/clock.h"
#include "capability/capability_catalog.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandboxed_api/util/fileops.h"
#include "sandboxed_api/util/path.h"
#include "util/json.h"

namespace scriptbox::sandbox {
namespace {

using ::google::protobuf::Value;
using ::scriptbox::capability::CapabilityRegistry;
using ::scriptbox::capability::LambdaCapabilityFunction;
using ::scriptbox::context::ExecutionContext;
using ::scriptbox::context::ExecutionContextBuilder;
using ::scriptbox::context::ExecutionContextOptions;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;
using State = RawExecutionOutcome::State;

TEST(ClassifyResultTest, MapsRunnerExitCodes) {
  RawExecutionOutcome outcome;
  sandbox2::Result result;
  result.SetExitStatusCode(sandbox2::Result::OK, 0);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kCompleted);
  EXPECT_EQ(outcome.exit_code, 0);

  result.SetExitStatusCode(sandbox2::Result::OK, kRunnerScriptError);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kCompleted);
  EXPECT_EQ(outcome.exit_code, 1);

  result.SetExitStatusCode(sandbox2::Result::OK, kRunnerOutOfMemory);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kKilledOom);

  result.SetExitStatusCode(sandbox2::Result::OK, kRunnerFault);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kCrashed);
}

TEST(ClassifyResultTest, MapsMonitorVerdicts) {
  RawExecutionOutcome outcome;
  sandbox2::Result result;
  result.SetExitStatusCode(sandbox2::Result::TIMEOUT, 0);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kTimedOut);

  result.SetExitStatusCode(sandbox2::Result::SIGNALED, SIGXCPU);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kKilledOom);

  result.SetExitStatusCode(sandbox2::Result::SIGNALED, SIGSEGV);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kCrashed);

  result.SetExitStatusCode(sandbox2::Result::VIOLATION, 0);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kCrashed);

  result.SetExitStatusCode(sandbox2::Result::SETUP_ERROR, 0);
  ClassifyResult(result, &outcome);
  EXPECT_EQ(outcome.state, State::kSpawnFailed);
}

class SandboxExecutorTest : public ::testing::Test {
 protected:
  SandboxExecutorTest()
      : scratch_root_(
            sapi::file::JoinPath(::testing::TempDir(), "sandbox_executor")),
        builder_(ExecutionContextOptions{.scratch_root = scratch_root_}) {
    CapabilityRegistry::FunctionMap functions;
    functions["servers/search/searchProducts"] =
        std::make_unique<LambdaCapabilityFunction>(
            [](const Value& input, const ExecutionContext& context)
                -> absl::StatusOr<Value> {
              return util::ParseJsonValue(absl::StrCat(
                  R"({"success": true, "data": {"tenant": ")",
                  context.tenant_id(), R"("}})"));
            });
    functions["servers/search/searchByCategory"] =
        std::make_unique<LambdaCapabilityFunction>(
            [](const Value& input, const ExecutionContext& context)
                -> absl::StatusOr<Value> {
              absl::SleepFor(context.TimeRemaining(absl::Now()));
              return absl::DeadlineExceededError("backend too slow");
            });
    registry_ = CapabilityRegistry::Create(
                    capability::BuiltinCatalog().value(), std::move(functions))
                    .value();
    executor_ = std::make_unique<SandboxExecutor>(
        SandboxOptions{.runner_path = SCRIPTBOX_RUNNER_PATH},
        registry_.get());
  }

  ExecutionContext NewContext(int64_t time_budget_ms = 5000,
                              absl::string_view tenant_id = "tenant-7") {
    return builder_
        .Build(tenant_id, "shop.example.com", "", time_budget_ms, absl::Now())
        .value();
  }

  const std::string scratch_root_;
  ExecutionContextBuilder builder_;
  std::unique_ptr<CapabilityRegistry> registry_;
  std::unique_ptr<SandboxExecutor> executor_;
};

TEST_F(SandboxExecutorTest, RunsScriptAndCapturesOutput) {
  ExecutionContext context = NewContext();
  RawExecutionOutcome outcome = executor_->Execute(
      "console.log(JSON.stringify({ total: 1 + 2 }));", {}, context);
  EXPECT_EQ(outcome.state, State::kCompleted) << outcome.detail;
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_bytes, "{\"total\":3}\n");
  EXPECT_FALSE(outcome.stdout_truncated);
}

TEST_F(SandboxExecutorTest, AnswersCapabilityCallsOnTheHost) {
  ExecutionContext context = NewContext();
  const std::vector<std::string> imports = {"servers/search/searchProducts"};
  RawExecutionOutcome outcome = executor_->Execute(R"(
    import { searchProducts } from './servers/search/searchProducts.ts';
    const found = await searchProducts({ query: 'pump' });
    console.log(JSON.stringify(found.data));
  )",
                                                   imports, context);
  EXPECT_EQ(outcome.state, State::kCompleted) << outcome.stderr_bytes;
  EXPECT_EQ(outcome.capability_calls, 1);
  EXPECT_EQ(outcome.stdout_bytes, "{\"tenant\":\"tenant-7\"}\n");
}

TEST_F(SandboxExecutorTest, ReportsScriptErrors) {
  ExecutionContext context = NewContext();
  RawExecutionOutcome outcome =
      executor_->Execute("throw new Error('nope');", {}, context);
  EXPECT_EQ(outcome.state, State::kCompleted);
  EXPECT_EQ(outcome.exit_code, kRunnerScriptError);
  EXPECT_THAT(outcome.stderr_bytes, StartsWith("Uncaught Error: nope"));
}

TEST_F(SandboxExecutorTest, KillsScriptsAtTheDeadline) {
  ExecutionContext context = NewContext(/*time_budget_ms=*/500);
  RawExecutionOutcome outcome =
      executor_->Execute("while (true) {}", {}, context);
  EXPECT_EQ(outcome.state, State::kTimedOut);
  EXPECT_LT(outcome.wall_time, absl::Seconds(5));
}

TEST_F(SandboxExecutorTest, CapabilityCallPastTheDeadlineTimesOut) {
  ExecutionContext context = NewContext(/*time_budget_ms=*/500);
  const std::vector<std::string> imports = {
      "servers/search/searchByCategory"};
  RawExecutionOutcome outcome = executor_->Execute(R"(
    import { searchByCategory } from './servers/search/searchByCategory.ts';
    try {
      await searchByCategory({ category: 'lamps' });
    } catch (e) {
      console.log('caught');
    }
  )",
                                                   imports, context);
  EXPECT_EQ(outcome.state, State::kTimedOut) << outcome.stdout_bytes;
  EXPECT_EQ(outcome.capability_calls, 1);
  EXPECT_LT(outcome.wall_time, absl::Seconds(5));
}

TEST_F(SandboxExecutorTest, RemovesScratchDirectory) {
  ExecutionContext context = NewContext();
  const std::vector<std::string> imports = {"sandbox/scratch"};
  RawExecutionOutcome outcome = executor_->Execute(R"(
    import { writeFile } from 'sandbox/scratch';
    writeFile('notes.txt', 'hello');
  )",
                                                   imports, context);
  EXPECT_EQ(outcome.state, State::kCompleted) << outcome.stderr_bytes;
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_FALSE(sapi::file_util::fileops::Exists(context.scratch_dir(),
                                                /*fully_resolve=*/false));
}

TEST_F(SandboxExecutorTest, RunsUnderTheDefaultMemoryLimit) {
  SandboxExecutor executor(
      SandboxOptions{.runner_path = SCRIPTBOX_RUNNER_PATH,
                     .memory_limit_bytes = size_t{512} << 20},
      registry_.get());
  ExecutionContext context = NewContext();
  RawExecutionOutcome outcome = executor.Execute(
      "const xs = []; for (let i = 0; i < 1000; i++) xs.push({ i });"
      "console.log(xs.length);",
      {}, context);
  EXPECT_EQ(outcome.state, State::kCompleted) << outcome.stderr_bytes;
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_bytes, "1000\n");
}

TEST_F(SandboxExecutorTest, HeapExhaustionIsKilledOom) {
  SandboxExecutor executor(
      SandboxOptions{.runner_path = SCRIPTBOX_RUNNER_PATH,
                     .memory_limit_bytes = size_t{128} << 20},
      registry_.get());
  ExecutionContext context = NewContext(/*time_budget_ms=*/20000);
  RawExecutionOutcome outcome = executor.Execute(
      "const hoard = []; while (true) hoard.push(new Array(1 << 16).fill(1));",
      {}, context);
  EXPECT_EQ(outcome.state, State::kKilledOom) << outcome.stderr_bytes;
}

TEST_F(SandboxExecutorTest, ConcurrentTenantsSeeOnlyTheirOwnScratchFiles) {
  const std::vector<std::string> imports = {"sandbox/scratch"};
  const std::string script_template = R"(
    import { writeFile, readFile, listFiles } from 'sandbox/scratch';
    writeFile('$0-1.txt', '$0');
    writeFile('$0-2.txt', '$0');
    if (readFile('$0-1.txt') !== '$0') console.log('lost own file');
    try {
      readFile('$1-1.txt');
      console.log('read $1');
    } catch (e) {}
    console.log(JSON.stringify(listFiles()));
  )";
  ExecutionContext first = NewContext(5000, "tenant-a");
  ExecutionContext second = NewContext(5000, "tenant-b");
  ASSERT_NE(first.scratch_dir(), second.scratch_dir());

  RawExecutionOutcome first_outcome, second_outcome;
  std::thread first_thread([&] {
    first_outcome = executor_->Execute(
        absl::Substitute(script_template, "alpha", "beta"), imports,
        first);
  });
  std::thread second_thread([&] {
    second_outcome = executor_->Execute(
        absl::Substitute(script_template, "beta", "alpha"), imports,
        second);
  });
  first_thread.join();
  second_thread.join();

  ASSERT_EQ(first_outcome.state, State::kCompleted)
      << first_outcome.stderr_bytes;
  ASSERT_EQ(second_outcome.state, State::kCompleted)
      << second_outcome.stderr_bytes;
  EXPECT_EQ(first_outcome.stdout_bytes,
            "[\"alpha-1.txt\",\"alpha-2.txt\"]\n");
  EXPECT_EQ(second_outcome.stdout_bytes,
            "[\"beta-1.txt\",\"beta-2.txt\"]\n");
}

TEST_F(SandboxExecutorTest, HostEnvironmentIsNotInherited) {
  ASSERT_EQ(setenv("SCRIPTBOX_HOST_ONLY", "sk_live_host_value", 1), 0);
  ExecutionContext context = NewContext();
  const std::vector<std::string> imports = {"sandbox/scratch"};
  RawExecutionOutcome outcome = executor_->Execute(R"(
    import { readFile } from 'sandbox/scratch';
    console.log(typeof process, typeof Deno, typeof require);
    try {
      console.log(readFile('../../proc/self/environ'));
    } catch (e) {
      console.log('blocked');
    }
  )",
                                                   imports, context);
  unsetenv("SCRIPTBOX_HOST_ONLY");
  EXPECT_EQ(outcome.state, State::kCompleted) << outcome.stderr_bytes;
  EXPECT_EQ(outcome.stdout_bytes,
            "undefined undefined undefined\nblocked\n");
  EXPECT_THAT(outcome.stdout_bytes, Not(HasSubstr("sk_live_host_value")));
  EXPECT_THAT(outcome.stderr_bytes, Not(HasSubstr("sk_live_host_value")));
}

TEST_F(SandboxExecutorTest, ExpiredDeadlineNeverSpawns) {
  ExecutionContext context =
      builder_.Build("tenant-7", "shop.example.com", "", 100,
                     absl::Now() - absl::Seconds(1))
          .value();
  RawExecutionOutcome outcome =
      executor_->Execute("console.log(1)", {}, context);
  EXPECT_EQ(outcome.state, State::kTimedOut);
  EXPECT_THAT(outcome.detail, HasSubstr("Deadline"));
}

}  // namespace
}  // namespace scriptbox::sandbox
