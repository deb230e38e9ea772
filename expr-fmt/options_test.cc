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

#include "expr-fmt/options.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace expr_fmt;
using namespace testing;

TEST(Options, DefaultsToUnicode) {
  RenderOptions options;

  EXPECT_THAT(options.notation, Eq(Notation::Unicode));
  EXPECT_THAT(notation_glyphs(options.notation).times, StrEq("×"));
  EXPECT_THAT(notation_glyphs(options.notation).divide, StrEq("÷"));
  EXPECT_THAT(notation_glyphs(options.notation).equals, StrEq(" == "));
}

TEST(Options, ParseNotation) {
  Error error;

  EXPECT_THAT(parse_notation("unicode", error), Eq(Notation::Unicode));
  EXPECT_THAT(static_cast<bool>(error), IsFalse());
  EXPECT_THAT(parse_notation("ascii", error), Eq(Notation::Ascii));
  EXPECT_THAT(static_cast<bool>(error), IsFalse());
  EXPECT_THAT(parse_notation("LaTeX", error), Eq(Notation::Latex));
  EXPECT_THAT(static_cast<bool>(error), IsFalse());
}

TEST(Options, ParseNotationRoundTripsNames) {
  for (auto notation : {Notation::Unicode, Notation::Ascii, Notation::Latex}) {
    Error error;
    EXPECT_THAT(parse_notation(notation_name(notation), error), Eq(notation));
    EXPECT_THAT(error.code(), Eq(ErrorCode::kOk));
  }
}

TEST(Options, ParseUnknownNotation) {
  Error error;

  EXPECT_THAT(parse_notation("mathml", error), Eq(Notation::Unicode));
  EXPECT_THAT(static_cast<bool>(error), IsTrue());
  EXPECT_THAT(error.code(), Eq(ErrorCode::kUnknownNotation));
  EXPECT_THAT(error.message(), HasSubstr("unknown notation 'mathml'"));

  parse_notation("ascii", error);
  EXPECT_THAT(error.code(), Eq(ErrorCode::kOk));
  EXPECT_THAT(error.message(), IsEmpty());
}
