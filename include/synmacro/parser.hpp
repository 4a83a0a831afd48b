#pragma once
#include <string>
#include <string_view>

#include "synmacro/ast.hpp"
#include "synmacro/errors.hpp"

namespace synmacro {

// Reader for the host surface syntax (Kotlin-like expressions and statements).
//   literals   : 42  1.5  "text"  true  false  null
//   calls      : f(a, b)   f(a) { x -> x }   f { }
//   lambdas    : { a, b -> stmt; stmt }
//   operators  : || && == != < <= > >= + - * / %   prefix ! -   member a.b
//   statements : expressions and `val` / `var` declarations, separated by ';' or newlines
// Template mode additionally accepts holes: $name (expression splice), @name (value splice).
struct parse_options {
    bool template_mode = false;
    bool record_spans = true;
};

// Parse a compilation unit into a block node. Throws parse_error.
node_ptr parse_unit(std::string_view source, std::string_view file = "<memory>", parse_options opts = {});

// Parse a single expression. Throws parse_error.
node_ptr parse_expression(std::string_view source, std::string_view file = "<memory>", parse_options opts = {});

} // namespace synmacro
