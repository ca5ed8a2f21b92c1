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

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scriptbox::validator {
namespace {

using ::testing::Optional;

TEST(NormalizeSourceTest, DecodesEscapes) {
  EXPECT_EQ(NormalizeSource(R"(\x65v\u{61}l)"), "eval");
}

TEST(NormalizeSourceTest, JoinsSplitLiterals) {
  EXPECT_EQ(NormalizeSource("x['con' + 'struc' + 'tor']"),
            "x['constructor']");
  EXPECT_EQ(NormalizeSource("['ev', 'al'].join('')"), "['eval'].join()");
  EXPECT_EQ(NormalizeSource("`${'ev'}${'al'}`"), "`${'eval'}`");
}

TEST(FindBannedWordTest, AcceptsOrdinaryScript) {
  EXPECT_EQ(FindBannedWord(R"(
    // Process each result and fetch the best match.
    class Ranker {
      constructor(limit) { this.limit = limit; }
    }
    const evaluation = ['process', 'ing'].length;
    console.log(JSON.stringify({ evaluation }));
  )"),
            absl::nullopt);
}

TEST(FindBannedWordTest, FindsEscapedIdentifiers) {
  EXPECT_THAT(FindBannedWord(R"(const f = this['\x65val'];)"),
              Optional(std::string("eval")));
  EXPECT_THAT(FindBannedWord(R"(globalThis.x = 1;)"),
              Optional(std::string("globalThis")));
}

TEST(FindBannedWordTest, FindsConcatenatedLiterals) {
  EXPECT_THAT(FindBannedWord("const k = 'con' + 'structor';"),
              Optional(std::string("constructor")));
  EXPECT_THAT(FindBannedWord("const k = ['pro', 'cess'].join('');"),
              Optional(std::string("process")));
}

TEST(FindBannedWordTest, FindsCharacterCodeTricks) {
  EXPECT_THAT(FindBannedWord("String.fromCharCode(101, 118, 97, 108);"),
              Optional(std::string("fromCharCode")));
  EXPECT_THAT(FindBannedWord("atob('ZXZhbA==');"),
              Optional(std::string("atob")));
}

}  // namespace
}  // namespace scriptbox::validator
