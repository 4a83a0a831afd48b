#pragma once
#include <optional>
#include <string>
#include <vector>

#include "synmacro/ast.hpp"
#include "synmacro/registry.hpp"

namespace synmacro {

// A call whose callee is a bare identifier. Ephemeral; borrows from the tree.
struct call_site {
    std::string name;
    std::vector<node_ptr> args;
    std::optional<source_span> span;
};

// Null when n is not a call or its callee is not a bare identifier.
std::optional<call_site> as_call_site(const node_ptr& n);

// Shape a node kind satisfies (hole and block/declaration have none: only `any` accepts them).
std::optional<parameter_shape> shape_of(node_kind k);
bool shape_accepts(parameter_shape s, const node& arg);

enum class match_status { matched, name_mismatch, arity_mismatch, shape_mismatch };
const char* status_name(match_status s);

match_status check(const macro_signature& sig, const call_site& site);

// Earliest-registered candidate whose signature accepts the site, or nullptr.
// No match is not an error: the call stays an ordinary call.
const macro_definition* match(const call_site& site, const std::vector<const macro_definition*>& candidates);
const macro_definition* match(const call_site& site, const macro_registry& registry);

} // namespace synmacro
