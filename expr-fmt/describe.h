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

#ifndef EXPR_FMT_DESCRIBE_H_
#define EXPR_FMT_DESCRIBE_H_

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "expr-fmt/ast.h"
#include "llvm/ADT/APSInt.h"
#include "llvm/Support/raw_ostream.h"

namespace expr_fmt {

/*
 * Writes the explicit structure of an expression, ignoring precedence:
 *
 *   Plus { lhs: 1, rhs: Negative { lhs: 2 } }
 *
 * Leaves are written as their value. Intended for debugging and logs, the
 * output is not meant to be parsed back.
 */
template <typename Number>
class Describer {
 public:
  explicit Describer(llvm::raw_ostream& os) : os_(os) {}

  void describe(const Expression<Number>& expr) { std::visit(*this, expr); }

  void operator()(const Atomic<Number>& e) { os_ << e.number(); }

  void operator()(const Negative<Number>& e) {
    os_ << Negative<Number>::NAME << " { lhs: ";
    describe(e.base());
    os_ << " }";
  }

  template <BinOp Op>
  void operator()(const BinaryExpr<Number, Op>& e) {
    os_ << bin_op_name(Op) << " { lhs: ";
    describe(e.lhs());
    os_ << ", rhs: ";
    describe(e.rhs());
    os_ << " }";
  }

 private:
  llvm::raw_ostream& os_;
};

/*
 * A visitor that dumps an expression as an indented tree, one node per line:
 *
 *   Plus
 *   |-1
 *   `-Times
 *     |-2
 *     `-3
 */
template <typename Number>
class TreePrinter {
 public:
  explicit TreePrinter(llvm::raw_ostream& os) : os_(os) {}

  void print(const Expression<Number>& expr) { std::visit(*this, expr); }

  void operator()(const Atomic<Number>& e) { os_ << e.number() << "\n"; }

  void operator()(const Negative<Number>& e) {
    os_ << Negative<Number>::NAME << "\n";
    print_last_child(e.base());
  }

  template <BinOp Op>
  void operator()(const BinaryExpr<Number, Op>& e) {
    os_ << bin_op_name(Op) << "\n";
    print_child(e.lhs());
    print_last_child(e.rhs());
  }

 private:
  void print_child(const Expression<Number>& e) { print("|-", "| ", e); }
  void print_last_child(const Expression<Number>& e) { print("`-", "  ", e); }

  void print(const char* header, std::string prefix,
             const Expression<Number>& e) {
    for (const auto& p : prefixes_) {
      os_ << p;
    }
    os_ << header;

    prefixes_.push_back(std::move(prefix));
    print(e);
    prefixes_.pop_back();
  }

 private:
  llvm::raw_ostream& os_;
  std::vector<std::string> prefixes_;
};

template <typename Number>
void describe(llvm::raw_ostream& os, const Expression<Number>& expr) {
  Describer<Number>(os).describe(expr);
}

template <typename Number>
std::string describe(const Expression<Number>& expr) {
  std::string text;
  llvm::raw_string_ostream os(text);
  describe(os, expr);
  return os.str();
}

// Dumps `expr` as a tree for debugging purposes, to stderr unless another
// stream is given.
template <typename Number>
void dump_expr(const Expression<Number>& expr,
               llvm::raw_ostream& os = llvm::errs()) {
  TreePrinter<Number>(os).print(expr);
}

extern template class Describer<llvm::APSInt>;
extern template class Describer<int64_t>;
extern template class TreePrinter<llvm::APSInt>;
extern template class TreePrinter<int64_t>;

}  // namespace expr_fmt

#endif  // EXPR_FMT_DESCRIBE_H_
