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

#include "expr-fmt/ast.h"

#include "expr-fmt/defines.h"

namespace expr_fmt {

static const char* BIN_OP_NAMES[NUM_BIN_OPS] = {
    "Concat",  // BinOp::Concat
    "Plus",    // BinOp::Plus
    "Minus",   // BinOp::Minus
    "Times",   // BinOp::Times
    "Divide",  // BinOp::Divide
};

const char* bin_op_name(BinOp op) {
  if ((size_t)op >= NUM_BIN_OPS) {
    expr_fmt_unreachable("invalid binary operator");
  }
  return BIN_OP_NAMES[(size_t)op];
}

}  // namespace expr_fmt
