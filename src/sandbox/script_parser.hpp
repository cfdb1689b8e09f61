#pragma once

#include <string>
#include "core/errors/ael_errors.hpp"
#include "sandbox/script_ast.hpp"

namespace ael::sandbox::script {

// Deepest nesting of parentheses, brackets, unary operators and blocks the
// parser accepts.
inline constexpr int kMaxNestingDepth = 200;

// Tallest expression tree the parser builds. Bounds every later recursive
// walk of the tree.
inline constexpr int kMaxExpressionDepth = 1000;

// Parses step-script source text. Syntax errors come back as "bad_syntax"
// with the offending line in the message.
//
//   import math
//   total = 0
//   for x in inputs.items { total = total + x }
//   if total > 10 { result = "big" } else { result = "small" }
//
// Statements end at a newline or ';'. Blocks use braces.
core::errors::Result<Program> parse_script(const std::string& source);

}  // namespace ael::sandbox::script
