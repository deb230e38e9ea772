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

#ifndef EXPR_FMT_OPTIONS_H_
#define EXPR_FMT_OPTIONS_H_

#include <cstddef>
#include <string>
#include <utility>

#include "llvm/ADT/StringRef.h"

namespace expr_fmt {

enum class ErrorCode : unsigned char {
  kOk = 0,
  kUnknownNotation,
};

class Error {
 public:
  void Set(ErrorCode code, std::string message) {
    code_ = code;
    message_ = std::move(message);
  }
  void Clear() { *this = {}; }

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  explicit operator bool() const { return code_ != ErrorCode::kOk; }

 private:
  ErrorCode code_ = ErrorCode::kOk;
  std::string message_;
};

// Glyph set used when rendering. All notations share the same parenthesization
// rules, only the emitted symbols differ.
enum class Notation : unsigned char {
  EnumFirst,
  Unicode = EnumFirst,
  Ascii,
  Latex,
  EnumLast = Latex,
};
inline constexpr size_t NUM_NOTATIONS = (size_t)Notation::EnumLast + 1;

struct Glyphs {
  const char* times;
  const char* divide;
  const char* open_paren;
  const char* close_paren;
  // Separates the value and the expression of a record.
  const char* equals;
};

const Glyphs& notation_glyphs(Notation notation);
const char* notation_name(Notation notation);

// Parses a notation name (`unicode`, `ascii` or `latex`, case-insensitive).
// Returns `Notation::Unicode` and sets `error` if the name is unknown.
Notation parse_notation(llvm::StringRef name, Error& error);

struct RenderOptions {
  Notation notation = Notation::Unicode;
};

}  // namespace expr_fmt

#endif  // EXPR_FMT_OPTIONS_H_
