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

#ifndef VALIDATOR_SCRIPT_LEXER_H_
#define VALIDATOR_SCRIPT_LEXER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace scriptbox::validator {

enum class TokenKind {
  kIdentifier,
  kPunctuator,
  kNumber,
  // String literal; `text` holds the decoded value.
  kString,
  // One literal chunk of a template; `text` holds the decoded chunk.
  kTemplate,
  // Regular expression literal; `text` holds the body without slashes.
  kRegex,
};

struct Token {
  TokenKind kind;
  // Identifiers are stored with unicode escapes decoded, so `eval`
  // reads as "eval".
  std::string text;
  int line;
};

// Splits JavaScript module source into tokens, skipping whitespace and
// comments. Distinguishes regular expressions from division using the
// previous token. Fails only on unterminated literals or comments.
absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view source);

// Appends the UTF-8 encoding of `code_point` to `out`.
void AppendUtf8(char32_t code_point, std::string* out);

}  // namespace scriptbox::validator

#endif  // VALIDATOR_SCRIPT_LEXER_H_
