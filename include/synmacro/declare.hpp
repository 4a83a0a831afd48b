// Typed declaration surface for macro authors.
//
//   registry.add(make_macro("f", [](const macro_context& ctx, literal_expr x) -> replacement_result { ... }));
//
// The optional leading `const macro_context&` is never matched against arguments. Every
// other parameter type maps to a parameter_shape:
//   expression / node_ptr  -> any
//   literal_expr           -> literal
//   identifier_expr        -> identifier
//   lambda_expr            -> lambda
//   call_expr              -> call
//   binary_expr            -> binary_op
#pragma once
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "synmacro/registry.hpp"

namespace synmacro {

// ------ Argument wrappers ------

class expression {
public:
    explicit expression(node_ptr n) : node_(std::move(n)) {
        if (!node_) throw std::invalid_argument("null macro argument");
    }
    const node_ptr& get() const { return node_; }
    const node& operator*() const { return *node_; }
    const node* operator->() const { return node_.get(); }
    operator node_ptr() const { return node_; }
    node_kind kind() const { return synmacro::kind(*node_); }
    std::optional<source_span> span() const { return locate(*node_); }

protected:
    expression(node_ptr n, node_kind expected) : expression(std::move(n)) {
        if (kind() != expected)
            throw std::invalid_argument(std::string("expected ") + kind_name(expected) + " argument, got " + kind_name(kind()));
    }

private:
    node_ptr node_;
};

struct literal_expr : expression {
    explicit literal_expr(node_ptr n) : expression(std::move(n), node_kind::literal) {}
    const scalar& value() const { return as_literal(**this)->value; }
    bool is_string() const { return std::holds_alternative<std::string>(value()); }
    const std::string* string_value() const { return std::get_if<std::string>(&value()); }
};

struct identifier_expr : expression {
    explicit identifier_expr(node_ptr n) : expression(std::move(n), node_kind::identifier) {}
    const std::string& name() const { return as_ident(**this)->name; }
};

struct lambda_expr : expression {
    explicit lambda_expr(node_ptr n) : expression(std::move(n), node_kind::lambda) {}
    const std::vector<std::string>& params() const { return as_lambda(**this)->params; }
    const std::vector<node_ptr>& body() const { return as_block(*as_lambda(**this)->body)->stmts; }
};

struct call_expr : expression {
    explicit call_expr(node_ptr n) : expression(std::move(n), node_kind::call) {}
    const node_ptr& callee() const { return as_call(**this)->callee; }
    const std::vector<node_ptr>& args() const { return as_call(**this)->args; }
};

struct binary_expr : expression {
    explicit binary_expr(node_ptr n) : expression(std::move(n), node_kind::binary_op) {}
    const std::string& op() const { return std::get<binary_op>((**this).data).op; }
    const node_ptr& lhs() const { return std::get<binary_op>((**this).data).lhs; }
    const node_ptr& rhs() const { return std::get<binary_op>((**this).data).rhs; }
};

// ------ Parameter type -> shape ------

template <typename T> struct shape_of_param {
    static_assert(sizeof(T) == 0, "macro parameters must be expression, node_ptr or one of the *_expr wrappers");
};
template <> struct shape_of_param<node_ptr> { static constexpr parameter_shape value = parameter_shape::any; };
template <> struct shape_of_param<expression> { static constexpr parameter_shape value = parameter_shape::any; };
template <> struct shape_of_param<literal_expr> { static constexpr parameter_shape value = parameter_shape::literal; };
template <> struct shape_of_param<identifier_expr> { static constexpr parameter_shape value = parameter_shape::identifier; };
template <> struct shape_of_param<lambda_expr> { static constexpr parameter_shape value = parameter_shape::lambda; };
template <> struct shape_of_param<call_expr> { static constexpr parameter_shape value = parameter_shape::call; };
template <> struct shape_of_param<binary_expr> { static constexpr parameter_shape value = parameter_shape::binary_op; };

namespace detail {

template <typename T> using bare_t = std::remove_cv_t<std::remove_reference_t<T>>;
template <typename... T> struct type_list {};

template <typename T> struct callable_traits : callable_traits<decltype(&T::operator())> {};
template <typename R, typename... A> struct callable_traits<R (*)(A...)> { using args = type_list<A...>; };
template <typename R, typename... A> struct callable_traits<R(A...)> { using args = type_list<A...>; };
template <typename R, typename C, typename... A> struct callable_traits<R (C::*)(A...)> { using args = type_list<A...>; };
template <typename R, typename C, typename... A> struct callable_traits<R (C::*)(A...) const> { using args = type_list<A...>; };

// Peel an optional leading macro_context parameter.
template <typename... A> struct split_context {
    using with_context = std::false_type;
    using params = type_list<A...>;
};
template <typename First, typename... Rest> struct split_context<First, Rest...> {
    using with_context = std::is_same<bare_t<First>, macro_context>;
    using params = std::conditional_t<with_context::value, type_list<Rest...>, type_list<First, Rest...>>;
};

inline replacement_result to_result(replacement_result r) { return r; }
inline replacement_result to_result(const expression& e) { return e.get(); }

template <typename Fn, typename... P, size_t... I>
replacement_result call_bound(Fn& fn, const macro_context& ctx, const std::vector<node_ptr>& args,
                              std::true_type, type_list<P...>, std::index_sequence<I...>) {
    return to_result(fn(ctx, bare_t<P>(args[I])...));
}

template <typename Fn, typename... P, size_t... I>
replacement_result call_bound(Fn& fn, const macro_context&, const std::vector<node_ptr>& args,
                              std::false_type, type_list<P...>, std::index_sequence<I...>) {
    return to_result(fn(bare_t<P>(args[I])...));
}

template <typename Fn, typename WithContext, typename... P>
macro_definition bind(std::string name, Fn fn, std::string origin, WithContext, type_list<P...>) {
    macro_definition def;
    def.signature = macro_signature{std::move(name), {shape_of_param<bare_t<P>>::value...}};
    def.origin = std::move(origin);
    def.impl = [fn = std::move(fn)](const macro_context& ctx, const std::vector<node_ptr>& args) mutable -> replacement_result {
        if (args.size() != sizeof...(P))
            ctx.fail("expected " + std::to_string(sizeof...(P)) + " argument(s), got " + std::to_string(args.size()));
        return call_bound(fn, ctx, args, WithContext{}, type_list<P...>{}, std::index_sequence_for<P...>{});
    };
    return def;
}

template <typename Fn, typename... A>
macro_definition bind_all(std::string name, Fn fn, std::string origin, type_list<A...>) {
    using s = split_context<A...>;
    return bind(std::move(name), std::move(fn), std::move(origin), typename s::with_context{}, typename s::params{});
}

} // namespace detail

// Build a definition whose signature is derived from fn's parameter types.
template <typename Fn>
macro_definition make_macro(std::string name, Fn fn, std::string origin = {}) {
    using args = typename detail::callable_traits<std::decay_t<Fn>>::args;
    return detail::bind_all(std::move(name), std::move(fn), std::move(origin), args{});
}

} // namespace synmacro
