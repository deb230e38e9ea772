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

#ifndef EXPR_FMT_RENDER_H_
#define EXPR_FMT_RENDER_H_

#include <cstdint>
#include <string>
#include <variant>

#include "expr-fmt/ast.h"
#include "expr-fmt/options.h"
#include "expr-fmt/precedence.h"
#include "llvm/ADT/APSInt.h"
#include "llvm/Support/raw_ostream.h"

namespace expr_fmt {

/*
 * Writes an expression in infix notation, emitting only the parentheses
 * required to keep it unambiguous under the usual rules (negation binds
 * tighter than `×` and `÷`, which bind tighter than `+` and `-`; all binary
 * operators are left-associative; juxtaposition binds tightest).
 *
 * Product chains are printed flat, `(2×3)×4` and `2×(3×4)` both come out as
 * `2×3×4`. A divisor is always wrapped unless it is a plain number.
 */
template <typename Number>
class Renderer {
 public:
  Renderer(llvm::raw_ostream& os, const RenderOptions& options)
      : os_(os), glyphs_(notation_glyphs(options.notation)) {}

  void render(const Expression<Number>& expr) { std::visit(*this, expr); }

  void operator()(const Atomic<Number>& e) { os_ << e.number(); }

  void operator()(const Negative<Number>& e) {
    os_ << "-";
    render_operand(e.base(), binds_looser_than_product(e.base()));
  }

  void operator()(const Concat<Number>& e) {
    render(e.lhs());
    render(e.rhs());
  }

  void operator()(const Plus<Number>& e) {
    render(e.lhs());
    os_ << "+";
    render(e.rhs());
  }

  void operator()(const Minus<Number>& e) {
    render(e.lhs());
    os_ << "-";
    render_operand(e.rhs(), binds_looser_than_product(e.rhs()));
  }

  void operator()(const Times<Number>& e) {
    render_operand(e.lhs(), binds_looser_than_product(e.lhs()));
    os_ << glyphs_.times;
    render_operand(e.rhs(), binds_looser_than_product(e.rhs()));
  }

  void operator()(const Divide<Number>& e) {
    render_operand(e.lhs(), binds_looser_than_product(e.lhs()));
    os_ << glyphs_.divide;
    render_operand(e.rhs(), !is_atomic_leaf(e.rhs()));
  }

 private:
  void render_operand(const Expression<Number>& operand, bool parenthesize) {
    if (parenthesize) {
      os_ << glyphs_.open_paren;
      render(operand);
      os_ << glyphs_.close_paren;
    } else {
      render(operand);
    }
  }

 private:
  llvm::raw_ostream& os_;
  const Glyphs& glyphs_;
};

template <typename Number>
void render(llvm::raw_ostream& os, const Expression<Number>& expr,
            const RenderOptions& options = RenderOptions()) {
  Renderer<Number>(os, options).render(expr);
}

template <typename Number>
std::string render(const Expression<Number>& expr,
                   const RenderOptions& options = RenderOptions()) {
  std::string text;
  llvm::raw_string_ostream os(text);
  render(os, expr, options);
  return os.str();
}

extern template class Renderer<llvm::APSInt>;
extern template class Renderer<int64_t>;

}  // namespace expr_fmt

#endif  // EXPR_FMT_RENDER_H_
