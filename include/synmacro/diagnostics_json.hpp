// diagnostics_json.hpp - JSON serialization for expansion diagnostics
#pragma once
#include "synmacro/diagnostics.hpp"
#include <string>
#include <vector>

namespace synmacro {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string:
// {"success":bool,"errors":[{"code","macro","message","unit","file","line","col","notes"}],"warnings":[...]}
std::string diagnostics_to_json(bool success, const std::vector<diagnostic>& diags);

// If SYNMACRO_DIAG_JSON=1 in the environment (or force is set), print diagnostics JSON to stderr.
void maybe_print_json(bool success, const std::vector<diagnostic>& diags, bool force = false);

} // namespace synmacro
