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

#include "validator/pattern_scan.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

namespace scriptbox::validator {
namespace {

enum class Position {
  // Not preceded by '.' or '?.'.
  kFreeReference,
  // Preceded by '.' or '?.', or a literal key in brackets.
  kMember,
  kAnywhere,
};

struct DenyRule {
  absl::string_view identifier;
  Position position;
  const char* pattern_class;
};

constexpr DenyRule kDenyRules[] = {
    {"eval", Position::kAnywhere, kDynamicEvaluation},
    {"Function", Position::kFreeReference, kDynamicEvaluation},
    {"WebAssembly", Position::kAnywhere, kDynamicEvaluation},
    {"importScripts", Position::kFreeReference, kDynamicEvaluation},

    {"require", Position::kFreeReference, kFilesystem},
    {"__dirname", Position::kFreeReference, kFilesystem},
    {"__filename", Position::kFreeReference, kFilesystem},
    {"readFileSync", Position::kAnywhere, kFilesystem},
    {"writeFileSync", Position::kAnywhere, kFilesystem},
    {"appendFileSync", Position::kAnywhere, kFilesystem},
    {"readdirSync", Position::kAnywhere, kFilesystem},
    {"unlinkSync", Position::kAnywhere, kFilesystem},
    {"rmSync", Position::kAnywhere, kFilesystem},
    {"createReadStream", Position::kAnywhere, kFilesystem},
    {"createWriteStream", Position::kAnywhere, kFilesystem},

    {"process", Position::kFreeReference, kProcessControl},
    {"Deno", Position::kFreeReference, kProcessControl},
    {"Bun", Position::kFreeReference, kProcessControl},
    {"child_process", Position::kAnywhere, kProcessControl},
    {"execSync", Position::kAnywhere, kProcessControl},
    {"spawnSync", Position::kAnywhere, kProcessControl},
    {"execFile", Position::kAnywhere, kProcessControl},
    {"Worker", Position::kFreeReference, kProcessControl},
    {"SharedWorker", Position::kFreeReference, kProcessControl},

    {"fetch", Position::kFreeReference, kNetwork},
    {"XMLHttpRequest", Position::kFreeReference, kNetwork},
    {"WebSocket", Position::kFreeReference, kNetwork},
    {"EventSource", Position::kFreeReference, kNetwork},
    {"navigator", Position::kFreeReference, kNetwork},
    {"sendBeacon", Position::kAnywhere, kNetwork},

    {"globalThis", Position::kFreeReference, kReflection},
    {"global", Position::kFreeReference, kReflection},
    {"window", Position::kFreeReference, kReflection},
    {"Reflect", Position::kFreeReference, kReflection},
    {"Proxy", Position::kFreeReference, kReflection},
    {"constructor", Position::kMember, kReflection},
    {"__proto__", Position::kAnywhere, kReflection},
    {"__defineGetter__", Position::kAnywhere, kReflection},
    {"__defineSetter__", Position::kAnywhere, kReflection},
    {"__lookupGetter__", Position::kAnywhere, kReflection},
    {"__lookupSetter__", Position::kAnywhere, kReflection},
    {"callee", Position::kMember, kReflection},
    {"caller", Position::kMember, kReflection},

    {"SharedArrayBuffer", Position::kFreeReference, kResourceAbuse},
    {"Atomics", Position::kFreeReference, kResourceAbuse},
    {"setTimeout", Position::kFreeReference, kResourceAbuse},
    {"setInterval", Position::kFreeReference, kResourceAbuse},
    {"setImmediate", Position::kFreeReference, kResourceAbuse},
};

bool IsPunctuator(const Token& token, absl::string_view text) {
  return token.kind == TokenKind::kPunctuator && token.text == text;
}

// An identifier that can precede an array literal rather than a member
// access.
bool IsKeyword(const Token& token) {
  static const auto* keywords = new absl::flat_hash_set<absl::string_view>{
      "return", "typeof", "in",     "of",   "case", "yield",      "await",
      "delete", "void",   "throw",  "new",  "else", "instanceof", "do"};
  return token.kind == TokenKind::kIdentifier && keywords->contains(token.text);
}

bool IsLiteral(const Token& token) {
  return token.kind == TokenKind::kString ||
         token.kind == TokenKind::kTemplate;
}

absl::optional<PatternMatch> MatchIdentifier(absl::Span<const Token> tokens,
                                             size_t index) {
  const Token& token = tokens[index];
  const bool member =
      index > 0 && (IsPunctuator(tokens[index - 1], ".") ||
                    IsPunctuator(tokens[index - 1], "?."));
  for (const DenyRule& rule : kDenyRules) {
    if (token.text != rule.identifier) {
      continue;
    }
    if (rule.position == Position::kAnywhere ||
        (rule.position == Position::kMember) == member) {
      return PatternMatch{rule.pattern_class,
                          member ? absl::StrCat(".", token.text) : token.text,
                          token.line};
    }
  }
  // `import(...)` loads modules the import stage never sees.
  if (token.text == "import" && index + 1 < tokens.size() &&
      IsPunctuator(tokens[index + 1], "(")) {
    return PatternMatch{kDynamicEvaluation, "import()", token.line};
  }
  return absl::nullopt;
}

// `tokens[open]` is '['. Joins the literal pieces up to the matching ']'
// and matches the result against every rule that applies to members.
absl::optional<PatternMatch> MatchComputedMember(absl::Span<const Token> tokens,
                                                 size_t open) {
  std::string key;
  int depth = 0;
  for (size_t i = open; i < tokens.size(); ++i) {
    if (IsPunctuator(tokens[i], "[")) {
      ++depth;
    } else if (IsPunctuator(tokens[i], "]") && --depth == 0) {
      break;
    } else if (IsLiteral(tokens[i])) {
      key += tokens[i].text;
    }
  }
  if (key.empty()) {
    return absl::nullopt;
  }
  for (const DenyRule& rule : kDenyRules) {
    if (rule.position != Position::kFreeReference &&
        key == rule.identifier) {
      return PatternMatch{rule.pattern_class,
                          absl::StrCat("['", rule.identifier, "']"),
                          tokens[open].line};
    }
  }
  return absl::nullopt;
}

}  // namespace

absl::optional<PatternMatch> FindDeniedPattern(absl::Span<const Token> tokens) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    absl::optional<PatternMatch> match;
    if (tokens[i].kind == TokenKind::kIdentifier) {
      match = MatchIdentifier(tokens, i);
    } else if (IsPunctuator(tokens[i], "[") && i > 0 &&
               ((tokens[i - 1].kind == TokenKind::kIdentifier &&
                 !IsKeyword(tokens[i - 1])) ||
                tokens[i - 1].kind == TokenKind::kString ||
                IsPunctuator(tokens[i - 1], ")") ||
                IsPunctuator(tokens[i - 1], "]") ||
                IsPunctuator(tokens[i - 1], "?."))) {
      match = MatchComputedMember(tokens, i);
    }
    if (match.has_value()) {
      return match;
    }
  }
  return absl::nullopt;
}

}  // namespace scriptbox::validator
