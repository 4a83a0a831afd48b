// Surface reader: PEGTL parse tree -> synmacro AST with source spans.
#include "synmacro/parser.hpp"
#include "grammar.hpp"

#include <stdexcept>

namespace synmacro {

namespace pt = tao::pegtl::parse_tree;
namespace g = grammar;

namespace {

struct builder {
    std::string file;
    parse_options opts;

    [[noreturn]] void fail(const pt::node& n, const std::string& message) const {
        auto p = n.begin();
        throw parse_error(message, file, static_cast<int>(p.line), static_cast<int>(p.column));
    }

    source_span span_of(const pt::node& first, const pt::node& last) const {
        auto b = first.begin();
        auto e = last.end();
        source_span s;
        s.file = file;
        s.start_line = static_cast<int>(b.line);
        s.start_col = static_cast<int>(b.column);
        s.end_line = static_cast<int>(e.line);
        s.end_col = e.column > 1 ? static_cast<int>(e.column) - 1 : 1;
        return s;
    }

    node_ptr located(node_ptr n, const pt::node& first, const pt::node& last) const {
        if (opts.record_spans) attach_span(*n, span_of(first, last));
        return n;
    }
    node_ptr located(node_ptr n, const pt::node& at) const { return located(std::move(n), at, at); }

    static std::string unescape(const std::string& quoted) {
        std::string out;
        for (size_t i = 1; i + 1 < quoted.size(); ++i) {
            char c = quoted[i];
            if (c != '\\') { out += c; continue; }
            char e = quoted[++i];
            switch (e) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '0': out += '\0'; break;
            default: out += e; break;
            }
        }
        return out;
    }

    node_ptr build_lambda(const pt::node& n) const {
        std::vector<std::string> params;
        const pt::node* body = nullptr;
        for (auto& ch : n.children) {
            if (ch->is<g::lambda_params>()) {
                for (auto& p : ch->children) params.push_back(p->string());
            } else if (ch->is<g::statements>()) {
                body = ch.get();
            }
        }
        node_ptr blk = body ? build_block(*body) : located(n_block({}), n);
        return located(make_node(lambda{std::move(params), blk}), n);
    }

    node_ptr build_block(const pt::node& n) const {
        std::vector<node_ptr> stmts;
        for (auto& ch : n.children) stmts.push_back(build(*ch));
        return located(n_block(std::move(stmts)), n);
    }

    // Left fold of `operand (op operand)*`
    node_ptr build_infix(const pt::node& n) const {
        const auto& ch = n.children;
        node_ptr acc = build(*ch.front());
        for (size_t i = 1; i + 1 < ch.size(); i += 2) {
            node_ptr rhs = build(*ch[i + 1]);
            acc = located(n_binary(ch[i]->string(), acc, rhs), *ch.front(), *ch[i + 1]);
        }
        return acc;
    }

    node_ptr build_postfix(const pt::node& n) const {
        const auto& ch = n.children;
        node_ptr acc = build(*ch.front());
        for (size_t i = 1; i < ch.size(); ++i) {
            const auto& op = *ch[i];
            if (op.is<g::member_name>()) {
                acc = located(n_member(acc, op.string()), *ch.front(), op);
            } else if (op.is<g::trailing_lambda>()) {
                call c{acc, {build_lambda(op)}, true};
                acc = located(make_node(std::move(c)), *ch.front(), op);
            } else if (op.is<g::call_suffix>()) {
                call c{acc, {}, false};
                for (auto& a : op.children) {
                    if (a->is<g::trailing_lambda>()) {
                        c.args.push_back(build_lambda(*a));
                        c.trailing_lambda = true;
                    } else {
                        c.args.push_back(build(*a));
                    }
                }
                acc = located(make_node(std::move(c)), *ch.front(), op);
            } else {
                fail(op, "unexpected postfix form");
            }
        }
        return acc;
    }

    node_ptr build(const pt::node& n) const {
        if (n.is<g::int_lit>()) {
            try {
                return located(n_int(std::stoll(n.string())), n);
            } catch (const std::out_of_range&) {
                fail(n, "integer literal out of range: " + n.string());
            }
        }
        if (n.is<g::float_lit>()) {
            try {
                return located(n_float(std::stod(n.string())), n);
            } catch (const std::out_of_range&) {
                fail(n, "float literal out of range: " + n.string());
            }
        }
        if (n.is<g::string_lit>()) return located(n_str(unescape(n.string())), n);
        if (n.is<g::true_lit>()) return located(n_bool(true), n);
        if (n.is<g::false_lit>()) return located(n_bool(false), n);
        if (n.is<g::null_lit>()) return located(n_null(), n);
        if (n.is<g::ident_tok>()) return located(n_ident(n.string()), n);
        if (n.is<g::expr_hole>() || n.is<g::value_hole>()) {
            if (!opts.template_mode) fail(n, "template hole '" + n.string() + "' outside of a template");
            auto k = n.is<g::expr_hole>() ? hole_kind::expression : hole_kind::value;
            return located(n_hole(k, n.string().substr(1)), n);
        }
        if (n.is<g::lambda_literal>() || n.is<g::trailing_lambda>()) return build_lambda(n);
        if (n.is<g::prefix_expr>()) {
            return located(n_unary(n.children.at(0)->string(), build(*n.children.at(1))), n);
        }
        if (n.is<g::mul_expr>() || n.is<g::add_expr>() || n.is<g::rel_expr>() ||
            n.is<g::eq_expr>() || n.is<g::and_expr>() || n.is<g::or_expr>())
            return build_infix(n);
        if (n.is<g::postfix_expr>()) return build_postfix(n);
        if (n.is<g::declaration>()) {
            bool is_mutable = n.children.at(0)->string() == "var";
            return located(n_decl(n.children.at(1)->string(), build(*n.children.at(2)), is_mutable), n);
        }
        if (n.is<g::statements>()) return build_block(n);
        fail(n, "unexpected syntax '" + n.string() + "'");
    }
};

template <typename Rule>
std::unique_ptr<pt::node> run(const std::string& src, const std::string& file) {
    tao::pegtl::memory_input in(src, file);
    try {
        auto root = pt::parse<Rule, g::selector>(in);
        if (!root) throw parse_error("parse failed", file, 1, 1);
        return root;
    } catch (const tao::pegtl::parse_error& e) {
        int line = 0, column = 0;
        if (!e.positions().empty()) {
            const auto& p = e.positions().front();
            line = static_cast<int>(p.line);
            column = static_cast<int>(p.column);
        }
        throw parse_error(e.what(), file, line, column);
    }
}

} // namespace

node_ptr parse_unit(std::string_view source, std::string_view file, parse_options opts) {
    std::string src(source);
    builder b{std::string(file), opts};
    auto root = run<g::unit_rule>(src, b.file);
    if (root->children.empty()) return n_block({});
    return b.build(*root->children.front());
}

node_ptr parse_expression(std::string_view source, std::string_view file, parse_options opts) {
    std::string src(source);
    builder b{std::string(file), opts};
    auto root = run<g::expression_rule>(src, b.file);
    if (root->children.size() != 1) throw parse_error("expected a single expression", b.file, 1, 1);
    return b.build(*root->children.front());
}

} // namespace synmacro
