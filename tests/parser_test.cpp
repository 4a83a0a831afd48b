#include <gtest/gtest.h>
#include "synmacro/parser.hpp"

using namespace synmacro;

static std::string roundtrip(const char* src){ return to_string(parse_expression(src)); }

TEST(Parser, Literals){
    auto i = parse_expression("42");
    ASSERT_TRUE(is_literal(*i));
    EXPECT_EQ(std::get<int64_t>(as_literal(*i)->value), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(as_literal(*parse_expression("1.25"))->value), 1.25);
    EXPECT_EQ(std::get<std::string>(as_literal(*parse_expression("\"a\\tb\\\"c\""))->value), "a\tb\"c");
    EXPECT_EQ(std::get<bool>(as_literal(*parse_expression("true"))->value), true);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(as_literal(*parse_expression("null"))->value));
}

TEST(Parser, PrecedenceAndAssociativity){
    auto e = parse_expression("a || b && c == d + e * f");
    ASSERT_EQ(kind(*e), node_kind::binary_op);
    EXPECT_EQ(std::get<binary_op>(e->data).op, "||");
    EXPECT_EQ(roundtrip("a || b && c == d + e * f"), "a || b && c == d + e * f");
    EXPECT_EQ(roundtrip("(a + b) * c"), "(a + b) * c");
    EXPECT_EQ(roundtrip("a - b - c"), "a - b - c");
    EXPECT_EQ(roundtrip("a - (b - c)"), "a - (b - c)");
    auto sub = parse_expression("a - b - c");
    EXPECT_EQ(kind(*std::get<binary_op>(sub->data).lhs), node_kind::binary_op);
    EXPECT_EQ(roundtrip("!(age >= 18)"), "!(age >= 18)");
    EXPECT_EQ(roundtrip("-x * 2"), "-x * 2");
}

TEST(Parser, CallsMembersAndLambdas){
    auto c = parse_expression("f(1, \"two\", g(x))");
    ASSERT_TRUE(is_call(*c));
    EXPECT_EQ(as_call(*c)->args.size(), 3u);
    EXPECT_EQ(callee_name(*as_call(*c)).value(), "f");

    EXPECT_EQ(roundtrip("list.filter { x -> x > 2 }"), "list.filter { x -> x > 2 }");
    EXPECT_EQ(roundtrip("a.b.c(d)"), "a.b.c(d)");
    EXPECT_EQ(roundtrip("f()"), "f()");

    auto t = parse_expression("run(1) { a, b -> a + b }");
    ASSERT_TRUE(is_call(*t));
    const auto* tc = as_call(*t);
    EXPECT_TRUE(tc->trailing_lambda);
    ASSERT_EQ(tc->args.size(), 2u);
    const auto* l = as_lambda(*tc->args[1]);
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->params, (std::vector<std::string>{"a", "b"}));

    auto bare = parse_expression("f{}");
    ASSERT_TRUE(is_call(*bare));
    ASSERT_EQ(as_call(*bare)->args.size(), 1u);
    EXPECT_EQ(kind(*as_call(*bare)->args[0]), node_kind::lambda);
    EXPECT_EQ(to_string(bare), "f {}");
}

TEST(Parser, UnitStatementsAndDeclarations){
    auto u = parse_unit("val x = 1\nvar y = x + 2; println(y)\n\n// done\n", "main.kt");
    ASSERT_TRUE(is_block(*u));
    const auto& stmts = as_block(*u)->stmts;
    ASSERT_EQ(stmts.size(), 3u);
    const auto& d0 = std::get<declaration>(stmts[0]->data);
    EXPECT_FALSE(d0.is_mutable);
    EXPECT_EQ(d0.name, "x");
    EXPECT_TRUE(std::get<declaration>(stmts[1]->data).is_mutable);
    EXPECT_TRUE(is_call(*stmts[2]));
    EXPECT_EQ(to_string(u), "val x = 1\nvar y = x + 2\nprintln(y)");
}

TEST(Parser, EmptyUnit){
    auto u = parse_unit("  \n /* nothing */ \n");
    ASSERT_TRUE(is_block(*u));
    EXPECT_TRUE(as_block(*u)->stmts.empty());
}

TEST(Parser, RecordsSpans){
    auto u = parse_unit("val x = foo(1, 2)\n  b(3)", "s.kt");
    const auto& stmts = as_block(*u)->stmts;
    auto decl = locate(*stmts[0]);
    ASSERT_TRUE(decl);
    EXPECT_EQ(decl->file, "s.kt");
    EXPECT_EQ(decl->start_line, 1);
    EXPECT_EQ(decl->start_col, 1);
    EXPECT_EQ(decl->end_col, 17);

    auto init = std::get<declaration>(stmts[0]->data).init;
    auto cs = locate(*init);
    ASSERT_TRUE(cs);
    EXPECT_EQ(cs->start_col, 9);
    EXPECT_EQ(cs->end_col, 17);
    auto arg = locate(*as_call(*init)->args[0]);
    ASSERT_TRUE(arg);
    EXPECT_EQ(arg->start_col, 13);

    auto second = locate(*stmts[1]);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->start_line, 2);
    EXPECT_EQ(second->start_col, 3);
    EXPECT_EQ(to_string(*second), "s.kt:2:3");
}

TEST(Parser, HolesOnlyInTemplateMode){
    EXPECT_THROW(parse_expression("f($x)"), parse_error);
    parse_options opts; opts.template_mode = true; opts.record_spans = false;
    auto t = parse_expression("f($x, @y)", "<t>", opts);
    const auto* c = as_call(*t);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(std::get<hole>(c->args[0]->data).kind, hole_kind::expression);
    EXPECT_EQ(std::get<hole>(c->args[0]->data).name, "x");
    EXPECT_EQ(std::get<hole>(c->args[1]->data).kind, hole_kind::value);
    EXPECT_FALSE(locate(*t).has_value());
}

TEST(Parser, ErrorsCarryPosition){
    try{
        parse_unit("f(1,\n)", "bad.kt");
        FAIL() << "expected parse_error";
    }catch(const parse_error& e){
        EXPECT_EQ(e.file, "bad.kt");
        EXPECT_EQ(e.line, 1);
        EXPECT_EQ(e.column, 4);
    }
    try{
        parse_unit("val a = 1\nf(a,\n)", "bad.kt");
        FAIL() << "expected parse_error";
    }catch(const parse_error& e){
        EXPECT_EQ(e.line, 2);
        EXPECT_EQ(e.column, 4);
    }
    EXPECT_THROW(parse_expression("\"unterminated"), parse_error);
    EXPECT_THROW(parse_expression("a b"), parse_error);
    EXPECT_THROW(parse_expression("99999999999999999999"), parse_error);
}
