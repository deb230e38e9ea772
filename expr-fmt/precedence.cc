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

#include "expr-fmt/precedence.h"

#include "expr-fmt/defines.h"

namespace expr_fmt {

static const bool LOOSER_THAN_PRODUCT_TABLE[NUM_BIN_OPS] = {
    false,  // BinOp::Concat
    true,   // BinOp::Plus
    true,   // BinOp::Minus
    false,  // BinOp::Times
    true,   // BinOp::Divide
};

bool binds_looser_than_product(BinOp op) {
  if ((size_t)op >= NUM_BIN_OPS) {
    expr_fmt_unreachable("invalid binary operator");
  }
  return LOOSER_THAN_PRODUCT_TABLE[(size_t)op];
}

}  // namespace expr_fmt
