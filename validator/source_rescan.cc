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

#include "validator/source_rescan.h"

#include <regex>
#include <utility>

#include "absl/strings/ascii.h"
#include "validator/script_lexer.h"

namespace scriptbox::validator {
namespace {

// Banned wherever they stand as a whole word.
constexpr absl::string_view kBannedWords[] = {
    "eval",        "globalThis",    "Reflect",      "child_process",
    "Deno",        "XMLHttpRequest", "WebSocket",   "WebAssembly",
    "__proto__",   "fromCharCode",  "fromCodePoint", "atob",
    "unescape",
};

// Banned only as the entire content of a string literal.
constexpr absl::string_view kBannedLiterals[] = {
    "Function", "constructor", "process", "require",
    "fetch",    "Proxy",       "import",  "global",
};

bool IsWordChar(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         c == '$';
}

bool IsQuote(char c) { return c == '\'' || c == '"' || c == '`'; }

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Parses `count` hex digits at `text[pos]`; returns -1 on failure.
long ParseHex(absl::string_view text, size_t pos, size_t count) {
  if (pos + count > text.size() || count == 0) {
    return -1;
  }
  long value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    const int digit = HexValue(text[i]);
    if (digit < 0) {
      return -1;
    }
    value = value * 16 + digit;
  }
  return value;
}

std::string DecodeEscapes(absl::string_view source) {
  std::string out;
  out.reserve(source.size());
  size_t i = 0;
  while (i < source.size()) {
    if (source[i] == '\\' && i + 1 < source.size()) {
      const char kind = source[i + 1];
      if (kind == 'x') {
        if (long value = ParseHex(source, i + 2, 2); value >= 0) {
          AppendUtf8(static_cast<char32_t>(value), &out);
          i += 4;
          continue;
        }
      } else if (kind == 'u' && i + 2 < source.size() &&
                 source[i + 2] == '{') {
        const size_t close = source.find('}', i + 3);
        if (close != absl::string_view::npos && close - (i + 3) <= 6) {
          if (long value = ParseHex(source, i + 3, close - (i + 3));
              value >= 0 && value <= 0x10FFFF) {
            AppendUtf8(static_cast<char32_t>(value), &out);
            i = close + 1;
            continue;
          }
        }
      } else if (kind == 'u') {
        if (long value = ParseHex(source, i + 2, 4); value >= 0) {
          AppendUtf8(static_cast<char32_t>(value), &out);
          i += 6;
          continue;
        }
      }
    }
    out.push_back(source[i]);
    ++i;
  }
  return out;
}

bool HasWordAt(absl::string_view text, size_t pos, absl::string_view word) {
  return (pos == 0 || !IsWordChar(text[pos - 1])) &&
         (pos + word.size() >= text.size() ||
          !IsWordChar(text[pos + word.size()]));
}

bool HasLiteralAt(absl::string_view text, size_t pos, absl::string_view word) {
  return pos > 0 && IsQuote(text[pos - 1]) &&
         pos + word.size() < text.size() && IsQuote(text[pos + word.size()]);
}

bool Contains(absl::string_view text, absl::string_view word,
              bool (*matches_at)(absl::string_view, size_t,
                                 absl::string_view)) {
  for (size_t pos = text.find(word); pos != absl::string_view::npos;
       pos = text.find(word, pos + 1)) {
    if (matches_at(text, pos, word)) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string NormalizeSource(absl::string_view source) {
  static const auto* substitution_joint = new std::regex(R"(\}\s*\$\{)");
  static const auto* literal_joint =
      new std::regex(R"(['"`]\s*[+,]?\s*['"`])");

  std::string text = DecodeEscapes(source);
  text = std::regex_replace(text, *substitution_joint, "");
  while (true) {
    std::string joined = std::regex_replace(text, *literal_joint, "");
    if (joined == text) {
      return text;
    }
    text = std::move(joined);
  }
}

absl::optional<std::string> FindBannedWord(absl::string_view source) {
  const std::string text = NormalizeSource(source);
  for (absl::string_view word : kBannedWords) {
    if (Contains(text, word, &HasWordAt)) {
      return std::string(word);
    }
  }
  for (absl::string_view word : kBannedLiterals) {
    if (Contains(text, word, &HasLiteralAt)) {
      return std::string(word);
    }
  }
  return absl::nullopt;
}

}  // namespace scriptbox::validator
