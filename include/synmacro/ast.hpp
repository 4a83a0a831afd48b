// Syntax tree shared by the reader, the template engine and the expansion pass.
// Node kinds form a closed variant; new syntax is added as a new alternative.
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "synmacro/location.hpp"

namespace synmacro {

struct node;
using node_ptr = std::shared_ptr<node>;

// Literal payload: null, bool, integer, float or string.
using scalar = std::variant<std::monostate, bool, int64_t, double, std::string>;

struct literal { scalar value; };
struct ident { std::string name; };
struct call {
    node_ptr callee;
    std::vector<node_ptr> args;
    bool trailing_lambda = false; // last arg written as `f(...) { }`
};
struct lambda {
    std::vector<std::string> params;
    node_ptr body; // block
};
struct binary_op { std::string op; node_ptr lhs; node_ptr rhs; };
struct unary_op { std::string op; node_ptr operand; };
struct member { node_ptr object; std::string name; };
struct declaration { bool is_mutable = false; std::string name; node_ptr init; };
struct block { std::vector<node_ptr> stmts; };

enum class hole_kind { expression, value };
struct hole { hole_kind kind = hole_kind::expression; std::string name; };

// Alternative order must match node_kind.
using node_data = std::variant<literal, ident, call, lambda, binary_op, unary_op, member, declaration, block, hole>;

enum class node_kind { literal, identifier, call, lambda, binary_op, unary_op, member, declaration, block, hole };

struct node {
    node_data data;
    source_span span{};
    span_state span_origin = span_state::unset;
    std::map<std::string, std::string> metadata; // e.g. "expanded-from" -> macro name
};

inline node_kind kind(const node& n) { return static_cast<node_kind>(n.data.index()); }
const char* kind_name(node_kind k);

inline bool is_call(const node& n) { return std::holds_alternative<call>(n.data); }
inline bool is_ident(const node& n) { return std::holds_alternative<ident>(n.data); }
inline bool is_literal(const node& n) { return std::holds_alternative<literal>(n.data); }
inline bool is_block(const node& n) { return std::holds_alternative<block>(n.data); }
inline const call* as_call(const node& n) { return std::get_if<call>(&n.data); }
inline const ident* as_ident(const node& n) { return std::get_if<ident>(&n.data); }
inline const literal* as_literal(const node& n) { return std::get_if<literal>(&n.data); }
inline const block* as_block(const node& n) { return std::get_if<block>(&n.data); }
inline const lambda* as_lambda(const node& n) { return std::get_if<lambda>(&n.data); }

// Name of a call's callee when it is a bare identifier.
inline std::optional<std::string> callee_name(const call& c) {
    if (c.callee && is_ident(*c.callee)) return std::get<ident>(c.callee->data).name;
    return std::nullopt;
}

// Deep copy; spans, span state and metadata are preserved.
node_ptr clone(const node_ptr& n);

// Structural deep equality. Spans and metadata are ignored unless compare_spans is set.
bool equal(const node_ptr& a, const node_ptr& b, bool compare_spans = false);

// Source rendering (statements of a block are newline separated).
std::string to_string(const node& n);
inline std::string to_string(const node_ptr& p) { return p ? to_string(*p) : std::string("<null>"); }
std::string to_string(const scalar& v);

// ------ Factory helpers ------

inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}, span_state::unset, {}}); }
inline node_ptr n_null() { return make_node(literal{std::monostate{}}); }
inline node_ptr n_bool(bool b) { return make_node(literal{b}); }
inline node_ptr n_int(int64_t v) { return make_node(literal{v}); }
inline node_ptr n_float(double v) { return make_node(literal{v}); }
inline node_ptr n_str(std::string s) { return make_node(literal{std::move(s)}); }
inline node_ptr n_lit(scalar v) { return make_node(literal{std::move(v)}); }
inline node_ptr n_ident(std::string name) { return make_node(ident{std::move(name)}); }
inline node_ptr n_call(node_ptr callee, std::vector<node_ptr> args) { return make_node(call{std::move(callee), std::move(args), false}); }
inline node_ptr n_call(std::string callee, std::vector<node_ptr> args) { return n_call(n_ident(std::move(callee)), std::move(args)); }
inline node_ptr n_block(std::vector<node_ptr> stmts) { return make_node(block{std::move(stmts)}); }
inline node_ptr n_lambda(std::vector<std::string> params, std::vector<node_ptr> body) {
    return make_node(lambda{std::move(params), n_block(std::move(body))});
}
inline node_ptr n_binary(std::string op, node_ptr l, node_ptr r) { return make_node(binary_op{std::move(op), std::move(l), std::move(r)}); }
inline node_ptr n_unary(std::string op, node_ptr operand) { return make_node(unary_op{std::move(op), std::move(operand)}); }
inline node_ptr n_member(node_ptr object, std::string name) { return make_node(member{std::move(object), std::move(name)}); }
inline node_ptr n_decl(std::string name, node_ptr init, bool is_mutable = false) {
    return make_node(declaration{is_mutable, std::move(name), std::move(init)});
}
inline node_ptr n_hole(hole_kind k, std::string name) { return make_node(hole{k, std::move(name)}); }

} // namespace synmacro
