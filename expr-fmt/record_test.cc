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

#include "expr-fmt/record.h"

#include <cstdint>
#include <string>

#include "expr-fmt/ast.h"
#include "expr-fmt/options.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "llvm/ADT/APSInt.h"
#include "llvm/Support/raw_ostream.h"

using namespace expr_fmt;
using namespace testing;

using Expr = Expression<int64_t>;

static Expr num(int64_t value) { return make_atomic<int64_t>(value); }

TEST(Record, Accessors) {
  Record<int64_t> record(24, make_times(num(6), num(4)));

  EXPECT_THAT(record.value(), Eq(24));
  EXPECT_THAT(render(record.expression()), Eq("6×4"));
}

TEST(Record, Render) {
  Record<int64_t> record(24, make_times(num(6), num(4)));

  EXPECT_THAT(render(record), Eq("24 == 6×4"));
}

TEST(Record, RenderWrapsOnlyWhatTheExpressionNeeds) {
  Record<int64_t> record(
      100, make_plus(make_concat(num(1), num(2)),
                     make_times(make_minus(num(3), num(4)), num(5))));

  EXPECT_THAT(render(record), Eq("100 == 12+(3-4)×5"));
}

TEST(Record, StreamOperator) {
  Record<int64_t> record(-1, make_negative(make_plus(num(0), num(1))));

  std::string text;
  llvm::raw_string_ostream os(text);
  os << record;

  EXPECT_THAT(os.str(), Eq("-1 == -(0+1)"));
}

TEST(Record, Notations) {
  Record<int64_t> record(2, make_divide(num(8), make_times(num(2), num(2))));

  RenderOptions ascii;
  ascii.notation = Notation::Ascii;
  RenderOptions latex;
  latex.notation = Notation::Latex;

  EXPECT_THAT(render(record, ascii), Eq("2 == 8/(2*2)"));
  EXPECT_THAT(render(record, latex),
              Eq("2 = 8\\div \\left(2\\times 2\\right)"));
}

TEST(Record, Describe) {
  Record<int64_t> record(24, make_times(num(6), num(4)));

  EXPECT_THAT(describe(record), Eq("Record { expression: 6×4, value: 24 }"));
}

TEST(Record, DescribeDoesNotNestTheExpression) {
  Record<int64_t> record(
      -3, make_minus(num(1), make_plus(num(2), make_concat(num(0), num(2)))));

  EXPECT_THAT(describe(record),
              Eq("Record { expression: 1-(2+02), value: -3 }"));
}

TEST(Record, ApsIntValue) {
  llvm::APSInt value = llvm::APSInt::get(114514);
  Record<llvm::APSInt> record(
      value, make_concat(make_concat(make_atomic(llvm::APSInt::get(11)),
                                     make_atomic(llvm::APSInt::get(45))),
                         make_atomic(llvm::APSInt::get(14))));

  EXPECT_THAT(render(record), Eq("114514 == 114514"));
  EXPECT_THAT(describe(record),
              Eq("Record { expression: 114514, value: 114514 }"));
}
