// Deep copy + structural equality for syntax nodes.
#include "synmacro/ast.hpp"
#include <type_traits>

namespace synmacro {

const char* kind_name(node_kind k) {
    switch (k) {
    case node_kind::literal: return "literal";
    case node_kind::identifier: return "identifier";
    case node_kind::call: return "call";
    case node_kind::lambda: return "lambda";
    case node_kind::binary_op: return "binary-op";
    case node_kind::unary_op: return "unary-op";
    case node_kind::member: return "member";
    case node_kind::declaration: return "declaration";
    case node_kind::block: return "block";
    case node_kind::hole: return "hole";
    }
    return "<unknown>";
}

node_ptr clone(const node_ptr& n) {
    if (!n) return nullptr;
    auto out = std::make_shared<node>();
    out->span = n->span;
    out->span_origin = n->span_origin;
    out->metadata = n->metadata;
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, call>) {
            call c{clone(arg.callee), {}, arg.trailing_lambda};
            for (auto& a : arg.args) c.args.push_back(clone(a));
            out->data = std::move(c);
        } else if constexpr (std::is_same_v<T, lambda>) {
            out->data = lambda{arg.params, clone(arg.body)};
        } else if constexpr (std::is_same_v<T, binary_op>) {
            out->data = binary_op{arg.op, clone(arg.lhs), clone(arg.rhs)};
        } else if constexpr (std::is_same_v<T, unary_op>) {
            out->data = unary_op{arg.op, clone(arg.operand)};
        } else if constexpr (std::is_same_v<T, member>) {
            out->data = member{clone(arg.object), arg.name};
        } else if constexpr (std::is_same_v<T, declaration>) {
            out->data = declaration{arg.is_mutable, arg.name, clone(arg.init)};
        } else if constexpr (std::is_same_v<T, block>) {
            block b;
            for (auto& s : arg.stmts) b.stmts.push_back(clone(s));
            out->data = std::move(b);
        } else {
            out->data = arg; // literal, ident, hole
        }
    }, n->data);
    return out;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool spans) {
    if (a.get() == b.get()) return true;
    if (!a || !b) return false;
    if (a->data.index() != b->data.index()) return false;
    if (spans && (a->span_origin != b->span_origin || a->span != b->span)) return false;

    struct Visitor {
        const node& b; bool spans;
        bool cmp(const node_ptr& x, const node_ptr& y) const { return equal_impl(x, y, spans); }
        bool seq(const std::vector<node_ptr>& l, const std::vector<node_ptr>& r) const {
            if (l.size() != r.size()) return false;
            for (size_t i = 0; i < l.size(); ++i) if (!cmp(l[i], r[i])) return false;
            return true;
        }
        bool operator()(const literal& x) const { return x.value == std::get<literal>(b.data).value; }
        bool operator()(const ident& x) const { return x.name == std::get<ident>(b.data).name; }
        bool operator()(const call& x) const {
            const auto& y = std::get<call>(b.data);
            return cmp(x.callee, y.callee) && seq(x.args, y.args);
        }
        bool operator()(const lambda& x) const {
            const auto& y = std::get<lambda>(b.data);
            return x.params == y.params && cmp(x.body, y.body);
        }
        bool operator()(const binary_op& x) const {
            const auto& y = std::get<binary_op>(b.data);
            return x.op == y.op && cmp(x.lhs, y.lhs) && cmp(x.rhs, y.rhs);
        }
        bool operator()(const unary_op& x) const {
            const auto& y = std::get<unary_op>(b.data);
            return x.op == y.op && cmp(x.operand, y.operand);
        }
        bool operator()(const member& x) const {
            const auto& y = std::get<member>(b.data);
            return x.name == y.name && cmp(x.object, y.object);
        }
        bool operator()(const declaration& x) const {
            const auto& y = std::get<declaration>(b.data);
            return x.is_mutable == y.is_mutable && x.name == y.name && cmp(x.init, y.init);
        }
        bool operator()(const block& x) const { return seq(x.stmts, std::get<block>(b.data).stmts); }
        bool operator()(const hole& x) const {
            const auto& y = std::get<hole>(b.data);
            return x.kind == y.kind && x.name == y.name;
        }
    };
    return std::visit(Visitor{*b, spans}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b, bool compare_spans) { return equal_impl(a, b, compare_spans); }

} // namespace synmacro
