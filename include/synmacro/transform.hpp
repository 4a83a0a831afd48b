#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "synmacro/ast.hpp"
#include "synmacro/config.hpp"
#include "synmacro/context.hpp"
#include "synmacro/diagnostics.hpp"
#include "synmacro/matcher.hpp"
#include "synmacro/registry.hpp"

namespace synmacro {

// Global macro expansion pass.
//
// Walks a unit depth first. Every call whose callee is a bare identifier is offered to the
// matcher; a match runs the macro on the unexpanded arguments and the replacement is
// substituted and rescanned one level deeper. Non-macro calls keep their shape and have
// their callee and arguments scanned instead.
//   - empty result in statement position removes the statement
//   - empty result in expression position leaves the identifier `Unit`
//   - a block result in statement position is spliced into the enclosing block
// Reaching options.max_depth raises recursion_limit_error.
class Expander {
public:
    Expander(const macro_registry& registry, compile_time_config config, engine_options options = {});

    // Returns a fully expanded copy; the input tree is not modified. Throws macro_error.
    node_ptr expand(const node_ptr& unit);

    size_t expansions() const { return expansions_; }

private:
    const macro_registry& registry_;
    compile_time_config config_;
    engine_options options_;
    name_supply names_;
    std::vector<recursion_limit_error::frame> chain_;
    size_t expansions_ = 0;

    const macro_definition* find_macro(const node_ptr& n, std::optional<call_site>& site) const;
    replacement_result run_macro(const macro_definition& def, const call_site& site, int depth, const scope_frame* scope);

    node_ptr expand_expr(const node_ptr& n, int depth, const scope_frame* scope);
    node_ptr expand_block(const node& n, int depth, const scope_frame* parent);
    void expand_stmt(const node_ptr& n, int depth, scope_frame& scope, std::vector<node_ptr>& out);
};

struct compilation_unit {
    std::string name;
    node_ptr ast; // block
};

struct source_unit {
    std::string name;
    std::string text;
};

struct unit_result {
    std::string name;
    node_ptr ast; // null when the unit failed
    bool success = false;
    size_t expansions = 0;
    std::vector<diagnostic> diagnostics;
};

struct program_result {
    std::vector<unit_result> units; // input order
    std::vector<diagnostic> diagnostics;
    bool success = true;

    int exit_code() const { return success ? 0 : 1; }
    // Expanded units that may proceed to later phases.
    std::vector<compilation_unit> expanded() const;
};

// Expand every unit against a frozen registry. Units run on up to options.jobs threads;
// a failing unit is excluded and does not stop its siblings. Configuration is readable by
// macros only for the duration of this call. Diagnostics are echoed to `echo` as they occur.
program_result expand_program(const std::vector<compilation_unit>& units, const macro_registry& registry,
                              const config_store& config, const engine_options& options = {},
                              std::ostream* echo = nullptr);

// Same, reading each unit from source first; reader errors fail that unit with E2004.
program_result expand_sources(const std::vector<source_unit>& sources, const macro_registry& registry,
                              const config_store& config, const engine_options& options = {},
                              std::ostream* echo = nullptr);

} // namespace synmacro
