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

#ifndef EXPR_FMT_RECORD_H_
#define EXPR_FMT_RECORD_H_

#include <cstdint>
#include <string>
#include <utility>

#include "expr-fmt/ast.h"
#include "expr-fmt/options.h"
#include "expr-fmt/render.h"
#include "llvm/ADT/APSInt.h"
#include "llvm/Support/raw_ostream.h"

namespace expr_fmt {

// A target value together with an expression that is claimed to be equal to
// it. The claim is not checked.
template <typename Number>
class Record {
 public:
  Record(Number value, Expression<Number> expression)
      : value_(std::move(value)), expression_(std::move(expression)) {}

  const Number& value() const { return value_; }
  const Expression<Number>& expression() const { return expression_; }

 private:
  Number value_;
  Expression<Number> expression_;
};

// Writes `<value> == <expression>`, e.g. `24 == 6×4`.
template <typename Number>
void render(llvm::raw_ostream& os, const Record<Number>& record,
            const RenderOptions& options = RenderOptions()) {
  os << record.value() << notation_glyphs(options.notation).equals;
  render(os, record.expression(), options);
}

template <typename Number>
std::string render(const Record<Number>& record,
                   const RenderOptions& options = RenderOptions()) {
  std::string text;
  llvm::raw_string_ostream os(text);
  render(os, record, options);
  return os.str();
}

template <typename Number>
llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                              const Record<Number>& record) {
  render(os, record);
  return os;
}

// Writes `Record { expression: 6×4, value: 24 }`. Both fields are shown in
// their rendered form rather than as nested structure.
template <typename Number>
void describe(llvm::raw_ostream& os, const Record<Number>& record) {
  os << "Record { expression: ";
  render(os, record.expression());
  os << ", value: " << record.value() << " }";
}

template <typename Number>
std::string describe(const Record<Number>& record) {
  std::string text;
  llvm::raw_string_ostream os(text);
  describe(os, record);
  return os.str();
}

extern template class Record<llvm::APSInt>;
extern template class Record<int64_t>;

}  // namespace expr_fmt

#endif  // EXPR_FMT_RECORD_H_
