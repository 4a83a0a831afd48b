#pragma once
#include "synmacro/config.hpp"
#include "synmacro/context.hpp"
#include "synmacro/matcher.hpp"
#include "synmacro/registry.hpp"

namespace synmacro {

// Metadata key set on the root of every replacement.
inline constexpr const char* expanded_from_key = "expanded-from";

// Run a matched macro on the raw (unexpanded) argument nodes of a call site.
// Returns the replacement, detached from the macro's own nodes, with unset spans filled
// from the call site and the root tagged with the macro name; or the empty marker.
// Failures inside the macro surface as macro_error carrying macro name and call-site span:
// unresolved_hole_error keeps its category, anything else becomes macro_execution_error.
replacement_result invoke(const macro_definition& def, const call_site& site, const scope_view& scope,
                          const compile_time_config& config, int depth = 0, name_supply* names = nullptr);

} // namespace synmacro
