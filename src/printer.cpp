// Source printer: renders nodes back into surface syntax with minimal parentheses.
#include "synmacro/ast.hpp"
#include <cstdlib>
#include <limits>
#include <sstream>

namespace synmacro {

namespace {

int binary_precedence(const std::string& op) {
    if (op == "||") return 1;
    if (op == "&&") return 2;
    if (op == "==" || op == "!=") return 3;
    if (op == "<" || op == "<=" || op == ">" || op == ">=") return 4;
    if (op == "+" || op == "-") return 5;
    if (op == "*" || op == "/" || op == "%") return 6;
    return 0;
}

constexpr int prefix_prec = 7;
constexpr int postfix_prec = 8;
constexpr int atom_prec = 9;

bool negative_number(const scalar& v) {
    if (auto i = std::get_if<int64_t>(&v)) return *i < 0;
    if (auto d = std::get_if<double>(&v)) return *d < 0;
    return false;
}

int precedence(const node& n) {
    switch (kind(n)) {
    case node_kind::binary_op: return binary_precedence(std::get<binary_op>(n.data).op);
    case node_kind::unary_op: return prefix_prec;
    case node_kind::call:
    case node_kind::member: return postfix_prec;
    case node_kind::literal: return negative_number(std::get<literal>(n.data).value) ? prefix_prec : atom_prec;
    case node_kind::declaration:
    case node_kind::block: return 0;
    default: return atom_prec;
    }
}

std::string quote_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

// Shortest digits that read back to the same value, always in `d.d[e±d]` form.
std::string format_double(double d) {
    std::string s;
    for (int p = std::numeric_limits<double>::digits10; p <= std::numeric_limits<double>::max_digits10; ++p) {
        std::ostringstream oss;
        oss.precision(p);
        oss << d;
        s = oss.str();
        if (std::strtod(s.c_str(), nullptr) == d) break;
    }
    if (s.find_first_of("ni") != std::string::npos) return s; // nan, inf
    auto e = s.find('e');
    std::string mantissa = s.substr(0, e);
    if (mantissa.find('.') == std::string::npos) mantissa += ".0";
    return e == std::string::npos ? mantissa : mantissa + s.substr(e);
}

std::string print(const node& n);

std::string wrap(const node_ptr& n, bool paren) {
    auto s = to_string(n);
    return paren ? "(" + s + ")" : s;
}

std::string print_lambda(const lambda& l) {
    const auto* body = l.body ? as_block(*l.body) : nullptr;
    if (l.params.empty() && (!body || body->stmts.empty())) return "{}";
    std::string out = "{ ";
    for (size_t i = 0; i < l.params.size(); ++i) {
        if (i) out += ", ";
        out += l.params[i];
    }
    if (!l.params.empty()) out += " -> ";
    if (body) {
        for (size_t i = 0; i < body->stmts.size(); ++i) {
            if (i) out += "; ";
            out += to_string(body->stmts[i]);
        }
    }
    out += " }";
    return out;
}

std::string print(const node& n) {
    struct V {
        std::string operator()(const literal& l) const { return to_string(l.value); }
        std::string operator()(const ident& i) const { return i.name; }
        std::string operator()(const call& c) const {
            std::string out = wrap(c.callee, c.callee && precedence(*c.callee) < postfix_prec);
            size_t n_args = c.args.size();
            bool trailing = c.trailing_lambda && n_args > 0 && c.args.back() && as_lambda(*c.args.back());
            if (trailing) --n_args;
            if (!trailing || n_args > 0) {
                out += '(';
                for (size_t i = 0; i < n_args; ++i) {
                    if (i) out += ", ";
                    out += to_string(c.args[i]);
                }
                out += ')';
            }
            if (trailing) out += " " + print_lambda(std::get<lambda>(c.args.back()->data));
            return out;
        }
        std::string operator()(const lambda& l) const { return print_lambda(l); }
        std::string operator()(const binary_op& b) const {
            int p = binary_precedence(b.op);
            bool lp = b.lhs && precedence(*b.lhs) < p;
            bool rp = b.rhs && precedence(*b.rhs) <= p;
            return wrap(b.lhs, lp) + " " + b.op + " " + wrap(b.rhs, rp);
        }
        std::string operator()(const unary_op& u) const {
            return u.op + wrap(u.operand, u.operand && precedence(*u.operand) < prefix_prec);
        }
        std::string operator()(const member& m) const {
            return wrap(m.object, m.object && precedence(*m.object) < postfix_prec) + "." + m.name;
        }
        std::string operator()(const declaration& d) const {
            return std::string(d.is_mutable ? "var " : "val ") + d.name + " = " + to_string(d.init);
        }
        std::string operator()(const block& b) const {
            std::string out;
            for (size_t i = 0; i < b.stmts.size(); ++i) {
                if (i) out += '\n';
                out += to_string(b.stmts[i]);
            }
            return out;
        }
        std::string operator()(const hole& h) const { return (h.kind == hole_kind::expression ? "$" : "@") + h.name; }
    };
    return std::visit(V{}, n.data);
}

} // namespace

std::string to_string(const scalar& v) {
    struct V {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_double(d); }
        std::string operator()(const std::string& s) const { return quote_string(s); }
    };
    return std::visit(V{}, v);
}

std::string to_string(const node& n) { return print(n); }

} // namespace synmacro
