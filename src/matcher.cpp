#include "synmacro/matcher.hpp"

namespace synmacro {

std::optional<call_site> as_call_site(const node_ptr& n) {
    if (!n) return std::nullopt;
    auto c = as_call(*n);
    if (!c) return std::nullopt;
    auto name = callee_name(*c);
    if (!name) return std::nullopt;
    return call_site{*name, c->args, locate(*n)};
}

std::optional<parameter_shape> shape_of(node_kind k) {
    switch (k) {
    case node_kind::literal: return parameter_shape::literal;
    case node_kind::identifier: return parameter_shape::identifier;
    case node_kind::call: return parameter_shape::call;
    case node_kind::lambda: return parameter_shape::lambda;
    case node_kind::binary_op: return parameter_shape::binary_op;
    case node_kind::unary_op: return parameter_shape::unary_op;
    case node_kind::member: return parameter_shape::member;
    default: return std::nullopt;
    }
}

bool shape_accepts(parameter_shape s, const node& arg) {
    if (s == parameter_shape::any) return true;
    auto actual = shape_of(kind(arg));
    return actual && *actual == s;
}

const char* status_name(match_status s) {
    switch (s) {
    case match_status::matched: return "matched";
    case match_status::name_mismatch: return "name mismatch";
    case match_status::arity_mismatch: return "arity mismatch";
    case match_status::shape_mismatch: return "shape mismatch";
    }
    return "?";
}

match_status check(const macro_signature& sig, const call_site& site) {
    if (sig.name != site.name) return match_status::name_mismatch;
    if (sig.arity() != site.args.size()) return match_status::arity_mismatch;
    for (size_t i = 0; i < sig.arity(); ++i) {
        if (!site.args[i] || !shape_accepts(sig.params[i], *site.args[i])) return match_status::shape_mismatch;
    }
    return match_status::matched;
}

const macro_definition* match(const call_site& site, const std::vector<const macro_definition*>& candidates) {
    const macro_definition* best = nullptr;
    for (auto d : candidates) {
        if (check(d->signature, site) != match_status::matched) continue;
        if (!best || d->order < best->order) best = d;
    }
    return best;
}

const macro_definition* match(const call_site& site, const macro_registry& registry) {
    return match(site, registry.lookup(site.name));
}

} // namespace synmacro
