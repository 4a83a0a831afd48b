#include "synmacro/location.hpp"
#include "synmacro/ast.hpp"
#include <stdexcept>
#include <type_traits>

namespace synmacro {

std::optional<source_span> locate(const node& n) {
    if (n.span_origin == span_state::parsed || n.span_origin == span_state::inherited) return n.span;
    return std::nullopt;
}

void attach_span(node& n, source_span s) {
    if (n.span_origin != span_state::unset)
        throw std::logic_error("attach_span: node at " + to_string(n.span) + " already has a location");
    n.span = std::move(s);
    n.span_origin = span_state::parsed;
}

void mark_synthetic(node& n) {
    n.span = source_span{};
    n.span_origin = span_state::synthetic;
}

static void for_each_child(node& n, void (*fn)(node&, const source_span&), const source_span& s) {
    auto visit = [&](const node_ptr& c) { if (c) fn(*c, s); };
    std::visit([&](auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, call>) { visit(arg.callee); for (auto& a : arg.args) visit(a); }
        else if constexpr (std::is_same_v<T, lambda>) visit(arg.body);
        else if constexpr (std::is_same_v<T, binary_op>) { visit(arg.lhs); visit(arg.rhs); }
        else if constexpr (std::is_same_v<T, unary_op>) visit(arg.operand);
        else if constexpr (std::is_same_v<T, member>) visit(arg.object);
        else if constexpr (std::is_same_v<T, declaration>) visit(arg.init);
        else if constexpr (std::is_same_v<T, block>) { for (auto& st : arg.stmts) visit(st); }
    }, n.data);
}

void propagate_span(node& n, const source_span& s) {
    if (n.span_origin == span_state::unset) {
        n.span = s;
        n.span_origin = span_state::inherited;
    }
    for_each_child(n, &propagate_span, s);
}

std::string to_string(const source_span& s) {
    if (!s.known()) return "<unknown>";
    return s.file + ":" + std::to_string(s.start_line) + ":" + std::to_string(s.start_col);
}

} // namespace synmacro
