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

#include <string>
#include <utility>

#include "expr-fmt/defines.h"
#include "llvm/Support/FormatVariadic.h"

namespace expr_fmt {

struct NotationInfo {
  const char* name;
  Glyphs glyphs;
};

static const NotationInfo NOTATION_TABLE[NUM_NOTATIONS] = {
    {"unicode", {"×", "÷", "(", ")", " == "}},                  // Unicode
    {"ascii", {"*", "/", "(", ")", " == "}},                    // Ascii
    {"latex", {"\\times ", "\\div ", "\\left(", "\\right)", " = "}},  // Latex
};

static const NotationInfo& notation_info(Notation notation) {
  if ((size_t)notation >= NUM_NOTATIONS) {
    expr_fmt_unreachable("invalid notation");
  }
  return NOTATION_TABLE[(size_t)notation];
}

const Glyphs& notation_glyphs(Notation notation) {
  return notation_info(notation).glyphs;
}

const char* notation_name(Notation notation) {
  return notation_info(notation).name;
}

Notation parse_notation(llvm::StringRef name, Error& error) {
  for (size_t i = 0; i < NUM_NOTATIONS; ++i) {
    if (name.equals_insensitive(NOTATION_TABLE[i].name)) {
      error.Clear();
      return static_cast<Notation>(i);
    }
  }

  std::string msg = llvm::formatv(
      "unknown notation '{0}', expected one of: unicode, ascii, latex", name);
  error.Set(ErrorCode::kUnknownNotation, std::move(msg));
  return Notation::Unicode;
}

}  // namespace expr_fmt
