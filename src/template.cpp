#include "synmacro/template.hpp"
#include "synmacro/parser.hpp"

#include <algorithm>
#include <type_traits>

namespace synmacro {

namespace {

void collect_holes(const node_ptr& n, std::vector<template_hole>& out) {
    if (!n) return;
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, hole>) {
            auto seen = std::find_if(out.begin(), out.end(), [&](const template_hole& h) { return h.name == arg.name && h.kind == arg.kind; });
            if (seen == out.end()) out.push_back({arg.kind, arg.name});
        } else if constexpr (std::is_same_v<T, call>) {
            collect_holes(arg.callee, out);
            for (auto& a : arg.args) collect_holes(a, out);
        } else if constexpr (std::is_same_v<T, lambda>) collect_holes(arg.body, out);
        else if constexpr (std::is_same_v<T, binary_op>) { collect_holes(arg.lhs, out); collect_holes(arg.rhs, out); }
        else if constexpr (std::is_same_v<T, unary_op>) collect_holes(arg.operand, out);
        else if constexpr (std::is_same_v<T, member>) collect_holes(arg.object, out);
        else if constexpr (std::is_same_v<T, declaration>) collect_holes(arg.init, out);
        else if constexpr (std::is_same_v<T, block>) { for (auto& s : arg.stmts) collect_holes(s, out); }
    }, n->data);
}

struct filler {
    const expression_bindings& exprs;
    const value_bindings& values;

    node_ptr fill(const node& n) const {
        if (auto h = std::get_if<hole>(&n.data)) {
            if (h->kind == hole_kind::expression) return clone(exprs.at(h->name));
            return n_lit(values.at(h->name));
        }
        auto out = std::make_shared<node>();
        out->metadata = n.metadata;
        auto sub = [&](const node_ptr& c) { return c ? fill(*c) : node_ptr{}; };
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, call>) {
                call c{sub(arg.callee), {}, arg.trailing_lambda};
                for (auto& a : arg.args) c.args.push_back(sub(a));
                out->data = std::move(c);
            } else if constexpr (std::is_same_v<T, lambda>) out->data = lambda{arg.params, sub(arg.body)};
            else if constexpr (std::is_same_v<T, binary_op>) out->data = binary_op{arg.op, sub(arg.lhs), sub(arg.rhs)};
            else if constexpr (std::is_same_v<T, unary_op>) out->data = unary_op{arg.op, sub(arg.operand)};
            else if constexpr (std::is_same_v<T, member>) out->data = member{sub(arg.object), arg.name};
            else if constexpr (std::is_same_v<T, declaration>) out->data = declaration{arg.is_mutable, arg.name, sub(arg.init)};
            else if constexpr (std::is_same_v<T, block>) {
                block b;
                for (auto& s : arg.stmts) b.stmts.push_back(sub(s));
                out->data = std::move(b);
            } else out->data = arg;
        }, n.data);
        return out;
    }
};

} // namespace

quasi_template::quasi_template(std::shared_ptr<const node> skeleton, std::string source, template_form form)
    : skeleton_(std::move(skeleton)), source_(std::move(source)), form_(form) {
    collect_holes(std::const_pointer_cast<node>(skeleton_), holes_);
}

quasi_template parse_template(std::string_view source, template_form form) {
    parse_options opts;
    opts.template_mode = true;
    opts.record_spans = false;
    node_ptr skeleton = form == template_form::expression ? parse_expression(source, "<template>", opts)
                                                          : parse_unit(source, "<template>", opts);
    return quasi_template(std::move(skeleton), std::string(source), form);
}

node_ptr materialize(const quasi_template& t, const expression_bindings& exprs, const value_bindings& values) {
    std::vector<std::string> missing;
    for (auto& h : t.holes()) {
        bool bound = false;
        if (h.kind == hole_kind::expression) {
            auto it = exprs.find(h.name);
            bound = it != exprs.end() && it->second;
        } else {
            bound = values.count(h.name) > 0;
        }
        if (!bound) missing.push_back((h.kind == hole_kind::expression ? "$" : "@") + h.name);
    }
    if (!missing.empty()) throw unresolved_hole_error(std::move(missing));
    return filler{exprs, values}.fill(t.skeleton());
}

node_ptr quote(std::string_view source, const expression_bindings& exprs, const value_bindings& values) {
    return materialize(parse_template(source), exprs, values);
}

} // namespace synmacro
