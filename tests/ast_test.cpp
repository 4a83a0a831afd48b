#include <gtest/gtest.h>
#include "synmacro/ast.hpp"
#include "synmacro/parser.hpp"

using namespace synmacro;

TEST(Ast, CloneIsDeepAndIndependent){
    auto orig = n_call("f", { n_binary("+", n_ident("a"), n_int(1)) });
    orig->metadata["k"] = "v";
    auto copy = clone(orig);
    ASSERT_TRUE(equal(orig, copy));
    EXPECT_NE(orig.get(), copy.get());
    EXPECT_NE(as_call(*orig)->args[0].get(), as_call(*copy)->args[0].get());
    EXPECT_EQ(copy->metadata.at("k"), "v");

    std::get<call>(copy->data).args.push_back(n_int(2));
    EXPECT_EQ(as_call(*orig)->args.size(), 1u);
    EXPECT_FALSE(equal(orig, copy));
}

TEST(Ast, EqualityIgnoresSpansUnlessAsked){
    auto a = parse_expression("x + 1", "a.kt");
    auto b = n_binary("+", n_ident("x"), n_int(1));
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, b, true));
    EXPECT_TRUE(equal(a, clone(a), true));
}

TEST(Ast, KindsAndCalleeName){
    auto c = n_call("warn", {});
    EXPECT_EQ(kind(*c), node_kind::call);
    EXPECT_STREQ(kind_name(kind(*c)), "call");
    EXPECT_EQ(callee_name(*as_call(*c)).value(), "warn");
    auto m = n_call(n_member(n_ident("a"), "b"), {});
    EXPECT_FALSE(callee_name(*as_call(*m)).has_value());
}

TEST(Ast, PrinterUsesMinimalParentheses){
    EXPECT_EQ(to_string(n_binary("*", n_binary("+", n_ident("a"), n_ident("b")), n_ident("c"))), "(a + b) * c");
    EXPECT_EQ(to_string(n_binary("+", n_ident("a"), n_binary("*", n_ident("b"), n_ident("c")))), "a + b * c");
    EXPECT_EQ(to_string(n_binary("-", n_ident("a"), n_binary("-", n_ident("b"), n_ident("c")))), "a - (b - c)");
    EXPECT_EQ(to_string(n_unary("!", n_binary(">=", n_ident("age"), n_int(18)))), "!(age >= 18)");
    EXPECT_EQ(to_string(n_member(n_call("f", {}), "size")), "f().size");
}

TEST(Ast, PrinterLiteralsAndLambdas){
    EXPECT_EQ(to_string(n_str("a\"b\n")), "\"a\\\"b\\n\"");
    EXPECT_EQ(to_string(n_float(2.0)), "2.0");
    EXPECT_EQ(to_string(n_float(1.5)), "1.5");
    EXPECT_EQ(to_string(n_null()), "null");
    EXPECT_EQ(to_string(n_bool(false)), "false");
    EXPECT_EQ(to_string(n_lambda({}, {})), "{}");
    EXPECT_EQ(to_string(n_lambda({"x", "y"}, { n_binary("+", n_ident("x"), n_ident("y")) })), "{ x, y -> x + y }");
    EXPECT_EQ(to_string(n_decl("n", n_int(3), true)), "var n = 3");
    EXPECT_EQ(to_string(n_hole(hole_kind::value, "v")), "@v");
}

TEST(Ast, FloatsPrintInReadableFullPrecisionForm){
    EXPECT_EQ(to_string(n_float(3.14159265)), "3.14159265");
    EXPECT_EQ(to_string(n_float(1e20)), "1.0e+20");
    EXPECT_EQ(to_string(n_float(1234567.0)), "1234567.0");
    for(double x : {1e20, 1234567.0, 3.14159265, 0.1, 1e-300, 123456789.123456789, 1.7976931348623157e308}){
        auto printed = to_string(n_float(x));
        EXPECT_TRUE(equal(parse_expression(printed), n_float(x))) << printed;
    }
}
