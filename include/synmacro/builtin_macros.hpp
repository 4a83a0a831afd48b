#pragma once
#include "synmacro/registry.hpp"

namespace synmacro {

// Standard macros, registered under origin "synmacro.builtins":
//   warn(cond, msg)   -> !(cond) && println("<file:line:col>" + ": " + msg) when config flag
//                        `warnings` is set; deleted otherwise
//   stringify(e)      -> "<source text of e>"
//   file()            -> "<file of the call site>"
//   line()            -> <line of the call site>
//   cfg("key")        -> true / false from the compile-time config flag `key`
//   debugOnly { ... } -> the lambda's statements when config flag `debug` is set; deleted otherwise
void register_builtin_macros(macro_registry& registry);

inline constexpr const char* builtin_origin = "synmacro.builtins";

} // namespace synmacro
