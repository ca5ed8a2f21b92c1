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

#ifndef RESULT_RESULT_COLLECTOR_H_
#define RESULT_RESULT_COLLECTOR_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "proto/scriptbox.pb.h"
#include "sandbox/script_executor_interface.h"

namespace scriptbox::result {

inline constexpr char kRedacted[] = "[REDACTED]";

struct ResultOptions {
  // Limit for the JSON serialization of ExecutionResult.output.
  size_t max_output_bytes = 64 * 1024;
  size_t max_stderr_bytes = 8 * 1024;
};

// Turns a raw sandbox outcome into the client-facing ExecutionResult: picks
// the status, extracts the final JSON value from stdout, bounds output and
// stderr, and scrubs every known secret. Stateless after construction and
// safe to share between threads.
class ResultCollector {
 public:
  // `secrets` are the raw credential values that must never reach a client.
  ResultCollector(const ResultOptions& options,
                  std::vector<std::string> secrets);

  // Fills status, output, stderr_excerpt and diagnostics. `output` is set
  // if and only if the status is SUCCESS.
  ExecutionResult Collect(const sandbox::RawExecutionOutcome& outcome) const;

  // Replaces every secret in `text`, raw or JSON-escaped, with [REDACTED].
  std::string Redact(absl::string_view text) const;

 private:
  const ResultOptions options_;
  // (secret, replacement) pairs, longest secret first.
  std::vector<std::pair<std::string, std::string>> replacements_;
};

// The value a script reports: all of stdout if it is one JSON document,
// otherwise its last non-blank line. `earlier_lines` counts the non-blank
// lines before the final one.
struct FinalValue {
  std::string text;
  int earlier_lines = 0;
};
FinalValue ExtractFinalValue(absl::string_view stdout_text);

// Longest prefix (suffix) of `text` of at most `max_bytes` bytes that does
// not split a UTF-8 sequence.
absl::string_view Utf8Prefix(absl::string_view text, size_t max_bytes);
absl::string_view Utf8Suffix(absl::string_view text, size_t max_bytes);

}  // namespace scriptbox::result

#endif  // RESULT_RESULT_COLLECTOR_H_
