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

#include "result/result_collector.h"

#include <algorithm>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/struct.pb.h"
#include "spdlog/spdlog.h"
#include "util/json.h"

namespace scriptbox::result {
namespace {

using ::google::protobuf::ListValue;
using ::google::protobuf::Value;
using State = ::scriptbox::sandbox::RawExecutionOutcome::State;

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// `secret` as it appears inside a JSON string literal, or empty when it
// needs no escaping.
std::string JsonEscaped(const std::string& secret) {
  Value value;
  value.set_string_value(secret);
  absl::StatusOr<std::string> json = util::ToJson(value);
  if (!json.ok() || json->size() < 2) {
    return "";
  }
  std::string escaped = json->substr(1, json->size() - 2);
  return escaped == secret ? "" : escaped;
}

size_t JsonSize(const Value& value) {
  absl::StatusOr<std::string> json = util::ToJson(value);
  return json.ok() ? json->size() : 0;
}

// Longest prefix of `text` whose JSON string literal fits in `max_bytes`.
std::string JsonStringPrefix(absl::string_view text, size_t max_bytes) {
  Value literal;
  auto fits = [&](size_t length) {
    literal.set_string_value(std::string(Utf8Prefix(text, length)));
    return JsonSize(literal) <= max_bytes;
  };
  size_t low = 0;
  size_t high = std::min(text.size(), max_bytes);
  while (low < high) {
    const size_t mid = low + (high - low + 1) / 2;
    if (fits(mid)) {
      low = mid;
    } else {
      high = mid - 1;
    }
  }
  return std::string(Utf8Prefix(text, low));
}

}  // namespace

absl::string_view Utf8Prefix(absl::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t end = max_bytes;
  while (end > 0 && IsContinuationByte(text[end])) {
    --end;
  }
  return text.substr(0, end);
}

absl::string_view Utf8Suffix(absl::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t start = text.size() - max_bytes;
  while (start < text.size() && IsContinuationByte(text[start])) {
    ++start;
  }
  return text.substr(start);
}

FinalValue ExtractFinalValue(absl::string_view stdout_text) {
  FinalValue final_value;
  absl::string_view whole = absl::StripAsciiWhitespace(stdout_text);
  if (whole.empty()) {
    return final_value;
  }
  if (util::ParseJsonValue(whole).ok()) {
    final_value.text = std::string(whole);
    return final_value;
  }
  std::vector<absl::string_view> lines;
  for (absl::string_view line : absl::StrSplit(stdout_text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  final_value.text = std::string(lines.back());
  final_value.earlier_lines = static_cast<int>(lines.size()) - 1;
  return final_value;
}

ResultCollector::ResultCollector(const ResultOptions& options,
                                 std::vector<std::string> secrets)
    : options_(options) {
  for (std::string& secret : secrets) {
    if (secret.empty()) {
      continue;
    }
    std::string escaped = JsonEscaped(secret);
    if (!escaped.empty()) {
      replacements_.emplace_back(std::move(escaped), kRedacted);
    }
    replacements_.emplace_back(std::move(secret), kRedacted);
  }
  std::sort(replacements_.begin(), replacements_.end(),
            [](const auto& a, const auto& b) {
              return a.first.size() > b.first.size();
            });
}

std::string ResultCollector::Redact(absl::string_view text) const {
  if (replacements_.empty()) {
    return std::string(text);
  }
  return absl::StrReplaceAll(text, replacements_);
}

ExecutionResult ResultCollector::Collect(
    const sandbox::RawExecutionOutcome& outcome) const {
  ExecutionResult result;
  std::vector<std::string> diagnostics;

  switch (outcome.state) {
    case State::kCompleted: {
      if (outcome.exit_code != 0) {
        result.set_status(ExecutionResult::RUNTIME_ERROR);
        diagnostics.push_back(
            absl::StrCat("Script exited with code ", outcome.exit_code, "."));
        break;
      }
      const FinalValue final_value =
          ExtractFinalValue(Redact(outcome.stdout_bytes));
      if (final_value.text.empty()) {
        result.set_status(ExecutionResult::RUNTIME_ERROR);
        diagnostics.push_back(
            "Script produced no output; print the result with "
            "console.log(JSON.stringify(...)).");
        break;
      }
      absl::StatusOr<Value> value = util::ParseJsonValue(final_value.text);
      if (!value.ok()) {
        result.set_status(ExecutionResult::RUNTIME_ERROR);
        diagnostics.push_back(
            "The last line of stdout is not valid JSON; print the result "
            "with console.log(JSON.stringify(...)).");
        break;
      }
      result.set_status(ExecutionResult::SUCCESS);
      if (final_value.earlier_lines > 0) {
        diagnostics.push_back(absl::StrCat(
            "Ignored ", final_value.earlier_lines,
            " line(s) of partial output before the final value."));
      }
      const size_t size = JsonSize(*value);
      if (size <= options_.max_output_bytes) {
        *result.mutable_output() = *std::move(value);
      } else if (value->has_list_value()) {
        const ListValue& list = value->list_value();
        ListValue* prefix = result.mutable_output()->mutable_list_value();
        size_t used = 2;  // []
        for (const Value& element : list.values()) {
          const size_t element_size =
              JsonSize(element) + (prefix->values_size() > 0 ? 1 : 0);
          if (used + element_size > options_.max_output_bytes) {
            break;
          }
          used += element_size;
          *prefix->add_values() = element;
        }
        diagnostics.push_back(absl::StrCat(
            "Output of ", size, " bytes exceeded the limit of ",
            options_.max_output_bytes, " bytes; kept the first ",
            prefix->values_size(), " of ", list.values_size(),
            " array elements."));
      } else {
        absl::StatusOr<std::string> json = util::ToJson(*value);
        result.mutable_output()->set_string_value(JsonStringPrefix(
            json.ok() ? *json : "", options_.max_output_bytes));
        diagnostics.push_back(absl::StrCat(
            "Output of ", size, " bytes exceeded the limit of ",
            options_.max_output_bytes,
            " bytes; returned as a truncated JSON string."));
      }
      break;
    }
    case State::kTimedOut:
      result.set_status(ExecutionResult::TIMEOUT);
      diagnostics.push_back(outcome.detail);
      break;
    case State::kKilledOom:
      result.set_status(ExecutionResult::RESOURCE_EXCEEDED);
      diagnostics.push_back(outcome.detail);
      break;
    case State::kCrashed:
    case State::kSpawnFailed:
      result.set_status(ExecutionResult::INTERNAL_ERROR);
      diagnostics.push_back(absl::StrCat("Sandbox failure (",
                                         sandbox::StateName(outcome.state),
                                         "): ", outcome.detail));
      spdlog::error("Sandbox failure ({}): {}",
                    std::string(sandbox::StateName(outcome.state)),
                    outcome.detail);
      break;
  }

  if (outcome.stdout_truncated) {
    diagnostics.push_back(
        "stdout exceeded the capture limit; later output was lost.");
  }
  const std::string stderr_text = Redact(outcome.stderr_bytes);
  absl::string_view excerpt =
      Utf8Suffix(stderr_text, options_.max_stderr_bytes);
  if (excerpt.size() < stderr_text.size() || outcome.stderr_truncated) {
    diagnostics.push_back(absl::StrCat(
        "stderr truncated; kept the last ", excerpt.size(), " bytes."));
  }
  result.set_stderr_excerpt(std::string(excerpt));
  for (const std::string& diagnostic : diagnostics) {
    if (!diagnostic.empty()) {
      result.add_diagnostics(Redact(diagnostic));
    }
  }
  return result;
}

}  // namespace scriptbox::result
