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

#include "validator/script_lexer.h"

#include <array>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/substitute.h"

namespace scriptbox::validator {
namespace {

// Longest first.
constexpr std::array<absl::string_view, 47> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=",
    "?\?=", "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "?.",
    "++",   "--",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=",  "|=",  "^=",
    "**",   "<<",  ">>",  "{",   "}",   "(",   ")",   "[",   "]",   ";",
    ",",    "<",   ">",   "+",   "-",   "*",   "%"};

// Keywords after which a '/' starts a regular expression.
bool KeywordPrecedesExpression(absl::string_view word) {
  static const auto* keywords = new absl::flat_hash_set<absl::string_view>{
      "return", "typeof", "instanceof", "in",   "of",    "new",
      "delete", "void",   "throw",      "case", "do",    "else",
      "yield",  "await",  "extends"};
  return keywords->contains(word);
}

bool IsIdentifierStart(unsigned char c) {
  return absl::ascii_isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool IsIdentifierPart(unsigned char c) {
  return IsIdentifierStart(c) || absl::ascii_isdigit(c);
}

bool IsLineTerminator(char c) { return c == '\n' || c == '\r'; }

class Lexer {
 public:
  explicit Lexer(absl::string_view source) : source_(source) {}

  absl::StatusOr<std::vector<Token>> Run() {
    while (SkipWhitespaceAndComments()) {
      const char c = source_[pos_];
      absl::Status status;
      if (c == '`') {
        ++pos_;
        status = LexTemplateChunk();
      } else if (c == '}' && !template_depths_.empty() &&
                 template_depths_.back() == brace_depth_) {
        template_depths_.pop_back();
        ++pos_;
        status = LexTemplateChunk();
      } else if (c == '\'' || c == '"') {
        status = LexString(c);
      } else if (IsIdentifierStart(c) || c == '\\') {
        status = LexIdentifier();
      } else if (absl::ascii_isdigit(c) ||
                 (c == '.' && pos_ + 1 < source_.size() &&
                  absl::ascii_isdigit(source_[pos_ + 1]))) {
        LexNumber();
      } else if (c == '/' && RegexAllowed()) {
        status = LexRegex();
      } else {
        LexPunctuator();
      }
      if (!status.ok()) {
        return status;
      }
    }
    if (!status_.ok()) {
      return status_;
    }
    if (!template_depths_.empty()) {
      return Error("Unterminated template literal");
    }
    return std::move(tokens_);
  }

 private:
  absl::Status Error(absl::string_view what) const {
    return absl::InvalidArgumentError(
        absl::Substitute("$0 at line $1", what, line_));
  }

  void Emit(TokenKind kind, std::string text, int line) {
    tokens_.push_back({kind, std::move(text), line});
  }

  void Advance() {
    if (source_[pos_] == '\n') {
      ++line_;
    }
    ++pos_;
  }

  // Returns false at end of input or after recording an error in status_.
  bool SkipWhitespaceAndComments() {
    while (pos_ < source_.size()) {
      const char c = source_[pos_];
      if (absl::ascii_isspace(c)) {
        Advance();
      } else if (absl::StartsWith(source_.substr(pos_), "//")) {
        while (pos_ < source_.size() && !IsLineTerminator(source_[pos_])) {
          ++pos_;
        }
      } else if (absl::StartsWith(source_.substr(pos_), "/*")) {
        const size_t end = source_.find("*/", pos_ + 2);
        if (end == absl::string_view::npos) {
          status_ = Error("Unterminated comment");
          return false;
        }
        while (pos_ < end + 2) {
          Advance();
        }
      } else {
        return true;
      }
    }
    return false;
  }

  bool RegexAllowed() const {
    if (tokens_.empty()) {
      return true;
    }
    const Token& previous = tokens_.back();
    switch (previous.kind) {
      case TokenKind::kPunctuator:
        return previous.text != ")" && previous.text != "]" &&
               previous.text != "}";
      case TokenKind::kIdentifier:
        return KeywordPrecedesExpression(previous.text);
      default:
        return false;
    }
  }

  // Hex digits starting at `pos`; returns false if fewer than `count`.
  bool ReadHex(size_t pos, size_t count, char32_t* value) const {
    if (pos + count > source_.size()) {
      return false;
    }
    char32_t parsed = 0;
    for (char c : source_.substr(pos, count)) {
      if (!absl::ascii_isxdigit(c)) {
        return false;
      }
      parsed = parsed * 16 + (absl::ascii_isdigit(c)
                                  ? c - '0'
                                  : absl::ascii_tolower(c) - 'a' + 10);
    }
    *value = parsed;
    return true;
  }

  // Decodes \uXXXX or \u{X...} with pos_ at the 'u'. Leaves pos_ after it.
  bool ReadUnicodeEscape(char32_t* code_point) {
    if (pos_ + 1 < source_.size() && source_[pos_ + 1] == '{') {
      const size_t close = source_.find('}', pos_ + 2);
      if (close == absl::string_view::npos || close == pos_ + 2 ||
          close - (pos_ + 2) > 6 ||
          !ReadHex(pos_ + 2, close - (pos_ + 2), code_point)) {
        return false;
      }
      pos_ = close + 1;
      return true;
    }
    if (!ReadHex(pos_ + 1, 4, code_point)) {
      return false;
    }
    pos_ += 5;
    return true;
  }

  // Decodes the escape sequence whose backslash was already consumed.
  absl::Status ReadEscape(std::string* out) {
    if (pos_ >= source_.size()) {
      return Error("Unterminated escape sequence");
    }
    const char c = source_[pos_];
    char32_t code_point = 0;
    switch (c) {
      case 'n':
        out->push_back('\n');
        break;
      case 't':
        out->push_back('\t');
        break;
      case 'r':
        out->push_back('\r');
        break;
      case 'b':
        out->push_back('\b');
        break;
      case 'f':
        out->push_back('\f');
        break;
      case 'v':
        out->push_back('\v');
        break;
      case '0':
        out->push_back('\0');
        break;
      case 'x':
        if (!ReadHex(pos_ + 1, 2, &code_point)) {
          return Error("Malformed \\x escape");
        }
        AppendUtf8(code_point, out);
        pos_ += 3;
        return absl::OkStatus();
      case 'u':
        if (!ReadUnicodeEscape(&code_point)) {
          return Error("Malformed \\u escape");
        }
        AppendUtf8(code_point, out);
        return absl::OkStatus();
      case '\r':
        // Line continuation; \r\n counts as one terminator.
        Advance();
        if (pos_ < source_.size() && source_[pos_] == '\n') {
          Advance();
        }
        return absl::OkStatus();
      case '\n':
        Advance();
        return absl::OkStatus();
      default:
        out->push_back(c);
        break;
    }
    ++pos_;
    return absl::OkStatus();
  }

  absl::Status LexString(char quote) {
    const int line = line_;
    ++pos_;
    std::string value;
    while (pos_ < source_.size()) {
      const char c = source_[pos_];
      if (c == quote) {
        ++pos_;
        Emit(TokenKind::kString, std::move(value), line);
        return absl::OkStatus();
      }
      if (IsLineTerminator(c)) {
        break;
      }
      if (c == '\\') {
        ++pos_;
        if (absl::Status status = ReadEscape(&value); !status.ok()) {
          return status;
        }
        continue;
      }
      value.push_back(c);
      ++pos_;
    }
    return Error("Unterminated string literal");
  }

  // Reads template characters up to the closing backtick or the next "${".
  // The opening backtick or closing brace was already consumed.
  absl::Status LexTemplateChunk() {
    const int line = line_;
    std::string value;
    while (pos_ < source_.size()) {
      const char c = source_[pos_];
      if (c == '`') {
        ++pos_;
        Emit(TokenKind::kTemplate, std::move(value), line);
        return absl::OkStatus();
      }
      if (c == '$' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '{') {
        pos_ += 2;
        Emit(TokenKind::kTemplate, std::move(value), line);
        template_depths_.push_back(brace_depth_);
        return absl::OkStatus();
      }
      if (c == '\\') {
        ++pos_;
        if (absl::Status status = ReadEscape(&value); !status.ok()) {
          return status;
        }
        continue;
      }
      value.push_back(c);
      Advance();
    }
    return Error("Unterminated template literal");
  }

  absl::Status LexIdentifier() {
    const int line = line_;
    std::string name;
    while (pos_ < source_.size()) {
      const unsigned char c = source_[pos_];
      if (c == '\\') {
        char32_t code_point = 0;
        ++pos_;
        if (pos_ >= source_.size() || source_[pos_] != 'u' ||
            !ReadUnicodeEscape(&code_point)) {
          return Error("Malformed escape in identifier");
        }
        AppendUtf8(code_point, &name);
      } else if (IsIdentifierPart(c)) {
        name.push_back(c);
        ++pos_;
      } else {
        break;
      }
    }
    Emit(TokenKind::kIdentifier, std::move(name), line);
    return absl::OkStatus();
  }

  void LexNumber() {
    const size_t start = pos_;
    const bool hex_like = source_[pos_] == '0' && pos_ + 1 < source_.size() &&
                          absl::ascii_isalpha(source_[pos_ + 1]);
    while (pos_ < source_.size()) {
      const char c = source_[pos_];
      if (absl::ascii_isalnum(c) || c == '_' || c == '.') {
        ++pos_;
      } else if ((c == '+' || c == '-') && !hex_like &&
                 (source_[pos_ - 1] == 'e' || source_[pos_ - 1] == 'E')) {
        ++pos_;
      } else {
        break;
      }
    }
    Emit(TokenKind::kNumber, std::string(source_.substr(start, pos_ - start)),
         line_);
  }

  absl::Status LexRegex() {
    const int line = line_;
    ++pos_;
    const size_t start = pos_;
    bool in_class = false;
    while (pos_ < source_.size()) {
      const char c = source_[pos_];
      if (IsLineTerminator(c)) {
        break;
      }
      if (c == '\\') {
        pos_ += 2;
        continue;
      }
      if (c == '[') {
        in_class = true;
      } else if (c == ']') {
        in_class = false;
      } else if (c == '/' && !in_class) {
        std::string body(source_.substr(start, pos_ - start));
        ++pos_;
        while (pos_ < source_.size() && IsIdentifierPart(source_[pos_])) {
          ++pos_;
        }
        Emit(TokenKind::kRegex, std::move(body), line);
        return absl::OkStatus();
      }
      ++pos_;
    }
    return Error("Unterminated regular expression");
  }

  void LexPunctuator() {
    const absl::string_view rest = source_.substr(pos_);
    for (absl::string_view punctuator : kPunctuators) {
      if (absl::StartsWith(rest, punctuator)) {
        if (punctuator == "{") {
          ++brace_depth_;
        } else if (punctuator == "}") {
          --brace_depth_;
        }
        pos_ += punctuator.size();
        Emit(TokenKind::kPunctuator, std::string(punctuator), line_);
        return;
      }
    }
    // Remaining single characters ('.', '=', '!', '?', ':', '/', ...) and
    // anything unexpected become one-character punctuators.
    Emit(TokenKind::kPunctuator, std::string(1, source_[pos_]), line_);
    ++pos_;
  }

  const absl::string_view source_;
  size_t pos_ = 0;
  int line_ = 1;
  int brace_depth_ = 0;
  // Brace depth at which each open template substitution started.
  std::vector<int> template_depths_;
  std::vector<Token> tokens_;
  absl::Status status_;
};

}  // namespace

void AppendUtf8(char32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point <= 0x10FFFF) {
    out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view source) {
  return Lexer(source).Run();
}

}  // namespace scriptbox::validator
