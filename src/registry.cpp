#include "synmacro/registry.hpp"

namespace synmacro {

const char* shape_name(parameter_shape s) {
    switch (s) {
    case parameter_shape::any: return "Any";
    case parameter_shape::literal: return "Literal";
    case parameter_shape::identifier: return "Identifier";
    case parameter_shape::lambda: return "Lambda";
    case parameter_shape::call: return "Call";
    case parameter_shape::binary_op: return "BinaryOp";
    case parameter_shape::unary_op: return "UnaryOp";
    case parameter_shape::member: return "Member";
    }
    return "?";
}

std::string macro_signature::to_string() const {
    std::string out = name + "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i) out += ", ";
        out += shape_name(params[i]);
    }
    return out + ")";
}

const macro_definition& macro_registry::add(macro_signature sig, macro_impl impl, std::string origin) {
    macro_definition def;
    def.signature = std::move(sig);
    def.impl = std::move(impl);
    def.origin = std::move(origin);
    return add(std::move(def));
}

const macro_definition& macro_registry::add(macro_definition def) {
    if (frozen_) throw registry_frozen_error("macro registry is frozen; cannot register " + def.signature.to_string());
    if (!def.impl) throw std::invalid_argument("macro " + def.signature.to_string() + " has no implementation");
    for (auto& d : defs_) {
        if (d->signature == def.signature) throw duplicate_signature_error(def.signature.to_string(), def.origin, d->origin);
    }
    def.order = defs_.size();
    defs_.push_back(std::make_unique<macro_definition>(std::move(def)));
    return *defs_.back();
}

std::vector<const macro_definition*> macro_registry::lookup(const std::string& name) const {
    std::vector<const macro_definition*> out;
    for (auto& d : defs_)
        if (d->signature.name == name) out.push_back(d.get());
    return out;
}

std::vector<const macro_definition*> macro_registry::all() const {
    std::vector<const macro_definition*> out;
    for (auto& d : defs_) out.push_back(d.get());
    return out;
}

static bool covers(const macro_signature& earlier, const macro_signature& later) {
    if (earlier.name != later.name || earlier.arity() != later.arity()) return false;
    for (size_t i = 0; i < earlier.arity(); ++i) {
        if (earlier.params[i] != parameter_shape::any && earlier.params[i] != later.params[i]) return false;
    }
    return true;
}

std::vector<std::pair<const macro_definition*, const macro_definition*>> macro_registry::shadowed() const {
    std::vector<std::pair<const macro_definition*, const macro_definition*>> out;
    for (size_t j = 0; j < defs_.size(); ++j) {
        for (size_t i = 0; i < j; ++i) {
            if (covers(defs_[i]->signature, defs_[j]->signature)) {
                out.emplace_back(defs_[i].get(), defs_[j].get());
                break;
            }
        }
    }
    return out;
}

} // namespace synmacro
