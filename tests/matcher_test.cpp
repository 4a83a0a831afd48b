#include <gtest/gtest.h>
#include "synmacro/matcher.hpp"
#include "synmacro/parser.hpp"

using namespace synmacro;

static macro_impl tag(const std::string& label){
    return [label](const macro_context&, const std::vector<node_ptr>&) -> replacement_result { return n_str(label); };
}

static call_site site(const char* src){
    auto s = as_call_site(parse_expression(src, "m.kt"));
    if(!s) throw std::runtime_error(std::string("not a call site: ") + src);
    return *s;
}

TEST(Matcher, CallSiteRequiresBareIdentifierCallee){
    EXPECT_TRUE(as_call_site(parse_expression("f(1)")).has_value());
    EXPECT_FALSE(as_call_site(parse_expression("a.f(1)")).has_value());
    EXPECT_FALSE(as_call_site(parse_expression("f(1)(2)")).has_value());
    EXPECT_FALSE(as_call_site(parse_expression("1 + 2")).has_value());
    auto s = site("f(1, x)");
    EXPECT_EQ(s.name, "f");
    EXPECT_EQ(s.args.size(), 2u);
    ASSERT_TRUE(s.span);
    EXPECT_EQ(s.span->file, "m.kt");
}

// f(ctx, Literal)
TEST(Matcher, LiteralShape){
    macro_registry r;
    r.add({"f", {parameter_shape::literal}}, tag("f"));

    EXPECT_NE(match(site("f(123)"), r), nullptr);
    EXPECT_NE(match(site("f(\"Hello\")"), r), nullptr);

    macro_signature sig{"f", {parameter_shape::literal}};
    EXPECT_EQ(check(sig, site("f(123, \"Hello\")")), match_status::arity_mismatch);
    EXPECT_EQ(check(sig, site("f(prefix + \" World!\")")), match_status::shape_mismatch);
    EXPECT_EQ(check(sig, site("f{}")), match_status::shape_mismatch);
    EXPECT_EQ(check(sig, site("f()")), match_status::arity_mismatch);
    EXPECT_EQ(check(sig, site("g(1)")), match_status::name_mismatch);

    EXPECT_EQ(match(site("f(123, \"Hello\")"), r), nullptr);
    EXPECT_EQ(match(site("f(prefix + \" World!\")"), r), nullptr);
    EXPECT_EQ(match(site("f{}"), r), nullptr);
    EXPECT_EQ(match(site("f()"), r), nullptr);
}

TEST(Matcher, EarliestRegistrationWins){
    {
        macro_registry r;
        r.add({"m", {parameter_shape::literal}}, tag("literal"));
        r.add({"m", {parameter_shape::any}}, tag("any"));
        auto d = match(site("m(123)"), r);
        ASSERT_NE(d, nullptr);
        EXPECT_EQ(d->signature.params[0], parameter_shape::literal);
        auto other = match(site("m(x)"), r);
        ASSERT_NE(other, nullptr);
        EXPECT_EQ(other->signature.params[0], parameter_shape::any);
    }
    {
        macro_registry r;
        r.add({"m", {parameter_shape::any}}, tag("any"));
        r.add({"m", {parameter_shape::literal}}, tag("literal"));
        auto d = match(site("m(123)"), r);
        ASSERT_NE(d, nullptr);
        EXPECT_EQ(d->signature.params[0], parameter_shape::any);
    }
}

TEST(Matcher, CandidateOrderDoesNotOverrideRegistrationOrder){
    macro_registry r;
    auto& lit = r.add({"m", {parameter_shape::literal}}, tag("literal"));
    auto& any = r.add({"m", {parameter_shape::any}}, tag("any"));
    EXPECT_EQ(match(site("m(1)"), std::vector<const macro_definition*>{&any, &lit}), &lit);
}

TEST(Matcher, ArityMismatchNeverMatches){
    macro_registry r;
    r.add({"h", {}}, tag("0"));
    r.add({"h", {parameter_shape::any, parameter_shape::any}}, tag("2"));
    for(const char* src : {"h(1)", "h(1, 2, 3)", "h(a, b, c, d)"}) EXPECT_EQ(match(site(src), r), nullptr) << src;
    EXPECT_EQ(match(site("h()"), r)->signature.arity(), 0u);
    EXPECT_EQ(match(site("h(x, { y -> y })"), r)->signature.arity(), 2u);
}

TEST(Matcher, ShapesAreExactWithoutWidening){
    EXPECT_TRUE(shape_accepts(parameter_shape::any, *n_lambda({}, {})));
    EXPECT_TRUE(shape_accepts(parameter_shape::lambda, *n_lambda({}, {})));
    EXPECT_TRUE(shape_accepts(parameter_shape::identifier, *n_ident("x")));
    EXPECT_FALSE(shape_accepts(parameter_shape::literal, *n_ident("x")));
    EXPECT_FALSE(shape_accepts(parameter_shape::call, *n_member(n_ident("a"), "b")));
    EXPECT_TRUE(shape_accepts(parameter_shape::member, *n_member(n_ident("a"), "b")));
    EXPECT_TRUE(shape_accepts(parameter_shape::unary_op, *parse_expression("-x")));
    EXPECT_FALSE(shape_accepts(parameter_shape::literal, *parse_expression("-1")));
    EXPECT_FALSE(shape_of(node_kind::block).has_value());
}

TEST(Matcher, StatusNames){
    EXPECT_STREQ(status_name(match_status::matched), "matched");
    EXPECT_STREQ(status_name(match_status::name_mismatch), "name mismatch");
    EXPECT_STREQ(status_name(match_status::arity_mismatch), "arity mismatch");
    EXPECT_STREQ(status_name(match_status::shape_mismatch), "shape mismatch");
}
