#pragma once
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "synmacro/ast.hpp"
#include "synmacro/context.hpp"
#include "synmacro/errors.hpp"

namespace synmacro {

// Syntactic category a macro parameter accepts. `any` accepts every node kind;
// the others require the argument's kind to be exactly that one.
enum class parameter_shape { any, literal, identifier, lambda, call, binary_op, unary_op, member };

const char* shape_name(parameter_shape s);

struct macro_signature {
    std::string name;
    std::vector<parameter_shape> params; // excludes the leading context parameter

    size_t arity() const { return params.size(); }
    // e.g. "warn(Any, Any)"
    std::string to_string() const;
};

inline bool operator==(const macro_signature& a, const macro_signature& b) { return a.name == b.name && a.params == b.params; }
inline bool operator!=(const macro_signature& a, const macro_signature& b) { return !(a == b); }

using macro_impl = std::function<replacement_result(const macro_context&, const std::vector<node_ptr>&)>;

struct macro_definition {
    macro_signature signature;
    macro_impl impl;
    std::string origin; // registering library, for diagnostics
    size_t order = 0;   // registration index, assigned by the registry
};

// Signatures registered by libraries. Append-only until freeze(); read-only (and
// safe to share between threads) afterwards.
class macro_registry {
public:
    // Throws duplicate_signature_error or registry_frozen_error.
    const macro_definition& add(macro_signature sig, macro_impl impl, std::string origin = {});
    const macro_definition& add(macro_definition def);

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    // Definitions named `name`, in registration order.
    std::vector<const macro_definition*> lookup(const std::string& name) const;
    std::vector<const macro_definition*> all() const;
    size_t size() const { return defs_.size(); }

    // (winner, loser) pairs where the loser can never be selected: an earlier signature of
    // the same name and arity accepts every argument the later one does.
    std::vector<std::pair<const macro_definition*, const macro_definition*>> shadowed() const;

private:
    std::vector<std::unique_ptr<macro_definition>> defs_;
    bool frozen_ = false;
};

} // namespace synmacro
