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

#ifndef EXPR_FMT_AST_H_
#define EXPR_FMT_AST_H_

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>

namespace expr_fmt {

enum class BinOp : unsigned char {
  // Used to determine the first enum element.
  EnumFirst,
  // Juxtaposition of two operands, e.g. digits `1` and `2` forming `12`.
  Concat = EnumFirst,
  Plus,
  Minus,
  Times,
  Divide,
  // Used to determine the last enum element.
  EnumLast = Divide,
};
inline constexpr size_t NUM_BIN_OPS = (size_t)BinOp::EnumLast + 1;

// Name of the node kind as shown in structural dumps, e.g. `Plus`.
const char* bin_op_name(BinOp op);

template <typename Number>
class Atomic;
template <typename Number>
class Negative;
template <typename Number, BinOp Op>
class BinaryExpr;

template <typename Number>
using Concat = BinaryExpr<Number, BinOp::Concat>;
template <typename Number>
using Plus = BinaryExpr<Number, BinOp::Plus>;
template <typename Number>
using Minus = BinaryExpr<Number, BinOp::Minus>;
template <typename Number>
using Times = BinaryExpr<Number, BinOp::Times>;
template <typename Number>
using Divide = BinaryExpr<Number, BinOp::Divide>;

/*
 * An arithmetic expression tree with leaves of type `Number`.
 *
 * The only requirement on `Number` is that it can be written to an
 * `llvm::raw_ostream` via `operator<<`. Inner nodes own their children, trees
 * are move-only and are never modified once built.
 */
template <typename Number>
using Expression = std::variant<Atomic<Number>, Negative<Number>,
                                Concat<Number>, Plus<Number>, Minus<Number>,
                                Times<Number>, Divide<Number>>;

template <typename Number>
class Atomic {
 public:
  explicit Atomic(Number number) : number_(std::move(number)) {}

  const Number& number() const { return number_; }

 private:
  Number number_;
};

template <typename Number>
class Negative {
 public:
  static constexpr const char* NAME = "Negative";

  explicit Negative(Expression<Number> base)
      : base_(std::make_unique<Expression<Number>>(std::move(base))) {}

  const Expression<Number>& base() const { return *base_; }

 private:
  std::unique_ptr<Expression<Number>> base_;
};

template <typename Number, BinOp Op>
class BinaryExpr {
 public:
  BinaryExpr(Expression<Number> lhs, Expression<Number> rhs)
      : lhs_(std::make_unique<Expression<Number>>(std::move(lhs))),
        rhs_(std::make_unique<Expression<Number>>(std::move(rhs))) {}

  const Expression<Number>& lhs() const { return *lhs_; }
  const Expression<Number>& rhs() const { return *rhs_; }
  BinOp op() const { return Op; }

 private:
  std::unique_ptr<Expression<Number>> lhs_;
  std::unique_ptr<Expression<Number>> rhs_;
};

// Convenience constructors, so that trees can be spelled as nested calls:
// `make_times(make_atomic(6), make_atomic(4))`.

template <typename Number>
Expression<Number> make_atomic(Number number) {
  return Atomic<Number>(std::move(number));
}

template <typename Number>
Expression<Number> make_negative(Expression<Number> base) {
  return Negative<Number>(std::move(base));
}

template <typename Number>
Expression<Number> make_concat(Expression<Number> lhs,
                               Expression<Number> rhs) {
  return Concat<Number>(std::move(lhs), std::move(rhs));
}

template <typename Number>
Expression<Number> make_plus(Expression<Number> lhs, Expression<Number> rhs) {
  return Plus<Number>(std::move(lhs), std::move(rhs));
}

template <typename Number>
Expression<Number> make_minus(Expression<Number> lhs, Expression<Number> rhs) {
  return Minus<Number>(std::move(lhs), std::move(rhs));
}

template <typename Number>
Expression<Number> make_times(Expression<Number> lhs, Expression<Number> rhs) {
  return Times<Number>(std::move(lhs), std::move(rhs));
}

template <typename Number>
Expression<Number> make_divide(Expression<Number> lhs,
                               Expression<Number> rhs) {
  return Divide<Number>(std::move(lhs), std::move(rhs));
}

}  // namespace expr_fmt

#endif  // EXPR_FMT_AST_H_
