#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace synmacro::grammar {
using namespace tao::pegtl;

// Comments and whitespace. Newlines separate statements, so `sp` never crosses a line;
// `nl` is used where a line break is allowed (after operators, inside argument lists).
struct line_comment : seq< two<'/'>, until< at< eolf >, any > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct hspace : sor< one<' ', '\t', '\r'>, block_comment, line_comment > {};
struct sp : star< hspace > {};
struct nl : star< sor< hspace, eol > > {};

// Keywords and names
struct kw_val : keyword<'v','a','l'> {};
struct kw_var : keyword<'v','a','r'> {};
struct true_lit : keyword<'t','r','u','e'> {};
struct false_lit : keyword<'f','a','l','s','e'> {};
struct null_lit : keyword<'n','u','l','l'> {};
struct reserved : sor< kw_val, kw_var, true_lit, false_lit, null_lit > {};
struct ident_tok : seq< not_at< reserved >, tao::pegtl::identifier > {};

// Literals
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct float_lit : seq< plus< digit >, one<'.'>, plus< digit >, opt< exponent > > {};
struct int_lit : plus< digit > {};
struct escaped : seq< one<'\\'>, any > {};
struct string_lit : seq< one<'"'>, star< sor< escaped, not_one<'"', '\\', '\n'> > >, must< one<'"'> > > {};

// Template holes
struct expr_hole : seq< one<'$'>, tao::pegtl::identifier > {};
struct value_hole : seq< one<'@'>, tao::pegtl::identifier > {};

struct expression;
struct statements;

// { a, b -> stmts }
struct arrow : string<'-','>'> {};
struct lambda_param : ident_tok {};
struct lambda_params : seq< lambda_param, star< sp, one<','>, nl, lambda_param >, sp, arrow > {};
struct lambda_literal : seq< one<'{'>, nl, opt< lambda_params >, statements, must< one<'}'> > > {};

struct paren_expr : seq< one<'('>, nl, expression, nl, must< one<')'> > > {};

struct primary : sor< float_lit, int_lit, string_lit, true_lit, false_lit, null_lit,
                      expr_hole, value_hole, lambda_literal, paren_expr, ident_tok > {};

// Postfix: call arguments (with optional trailing lambda), bare trailing lambda, member access
struct trailing_lambda : lambda_literal {};
struct arg_sep : seq< nl, one<','>, nl > {};
struct call_suffix : seq< sp, one<'('>, nl, opt< list< expression, arg_sep > >, nl, must< one<')'> >,
                          opt< sp, trailing_lambda > > {};
struct trailing_call : seq< sp, trailing_lambda > {};
struct member_name : ident_tok {};
struct member_suffix : seq< sp, one<'.'>, sp, member_name > {};
struct postfix_expr : seq< primary, star< sor< call_suffix, trailing_call, member_suffix > > > {};

// Prefix and binary operators, lowest precedence last
struct prefix_op : one<'!', '-'> {};
struct unary_expr;
struct prefix_expr : seq< prefix_op, sp, unary_expr > {};
struct unary_expr : sor< prefix_expr, postfix_expr > {};

struct mul_op : one<'*', '/', '%'> {};
struct add_op : one<'+', '-'> {};
struct rel_op : sor< string<'<','='>, string<'>','='>, one<'<'>, one<'>'> > {};
struct eq_op : sor< string<'=','='>, string<'!','='> > {};
struct and_op : two<'&'> {};
struct or_op : two<'|'> {};

template< typename Op, typename Operand >
struct infix : seq< Operand, star< sp, Op, nl, Operand > > {};

struct mul_expr : infix< mul_op, unary_expr > {};
struct add_expr : infix< add_op, mul_expr > {};
struct rel_expr : infix< rel_op, add_expr > {};
struct eq_expr : infix< eq_op, rel_expr > {};
struct and_expr : infix< and_op, eq_expr > {};
struct or_expr : infix< or_op, and_expr > {};
struct expression : seq< or_expr > {};

// Statements
struct decl_kw : sor< kw_val, kw_var > {};
struct decl_name : ident_tok {};
struct declaration : seq< decl_kw, sp, decl_name, sp, one<'='>, nl, expression > {};
struct statement : sor< declaration, expression > {};
struct stmt_sep : seq< sp, sor< one<';'>, eol > > {};
struct statements : seq< nl, opt< statement >, star< stmt_sep, nl, opt< statement > >, nl > {};

struct unit_rule : must< statements, eof > {};
struct expression_rule : must< nl, expression, nl, eof > {};

template< typename Rule >
using selector = parse_tree::selector< Rule,
    parse_tree::store_content::on< float_lit, int_lit, string_lit, true_lit, false_lit, null_lit,
                                   expr_hole, value_hole, ident_tok, lambda_param, lambda_params,
                                   lambda_literal, trailing_lambda, call_suffix, member_name,
                                   prefix_op, prefix_expr, mul_op, add_op, rel_op, eq_op, and_op, or_op,
                                   decl_kw, decl_name, declaration, statements >,
    parse_tree::fold_one::on< postfix_expr, mul_expr, add_expr, rel_expr, eq_expr, and_expr, or_expr > >;

} // namespace synmacro::grammar
