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

#ifndef EXPR_FMT_PRECEDENCE_H_
#define EXPR_FMT_PRECEDENCE_H_

#include <variant>

#include "expr-fmt/ast.h"

namespace expr_fmt {

// Whether an operand built with `op` needs parentheses when it is placed
// under a multiplication, a division or a negation.
bool binds_looser_than_product(BinOp op);

namespace detail {

template <typename Number>
struct LooserThanProduct {
  bool operator()(const Atomic<Number>&) const { return false; }
  bool operator()(const Negative<Number>&) const { return false; }

  template <BinOp Op>
  bool operator()(const BinaryExpr<Number, Op>&) const {
    return binds_looser_than_product(Op);
  }
};

}  // namespace detail

// Looks at the node kind only, children are not inspected.
template <typename Number>
bool is_atomic_leaf(const Expression<Number>& expr) {
  return std::holds_alternative<Atomic<Number>>(expr);
}

// True for `Plus`, `Minus` and `Divide` nodes. `Times` is deliberately left
// out: product chains render flat, while a quotient operand is always wrapped.
template <typename Number>
bool binds_looser_than_product(const Expression<Number>& expr) {
  return std::visit(detail::LooserThanProduct<Number>(), expr);
}

}  // namespace expr_fmt

#endif  // EXPR_FMT_PRECEDENCE_H_
