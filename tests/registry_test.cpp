#include <gtest/gtest.h>
#include "synmacro/registry.hpp"

using namespace synmacro;

static macro_impl noop(){ return [](const macro_context&, const std::vector<node_ptr>&) -> replacement_result { return replacement_result::empty(); }; }

TEST(Registry, LookupKeepsRegistrationOrder){
    macro_registry r;
    r.add({"m", {parameter_shape::literal}}, noop(), "libA");
    r.add({"other", {}}, noop(), "libA");
    r.add({"m", {parameter_shape::any}}, noop(), "libB");
    auto ms = r.lookup("m");
    ASSERT_EQ(ms.size(), 2u);
    EXPECT_EQ(ms[0]->signature.to_string(), "m(Literal)");
    EXPECT_EQ(ms[1]->signature.to_string(), "m(Any)");
    EXPECT_LT(ms[0]->order, ms[1]->order);
    EXPECT_EQ(ms[1]->origin, "libB");
    EXPECT_TRUE(r.lookup("missing").empty());
    EXPECT_EQ(r.size(), 3u);
}

TEST(Registry, DuplicateSignatureNamesBothOrigins){
    macro_registry r;
    r.add({"warn", {parameter_shape::any, parameter_shape::any}}, noop(), "logging-a");
    try{
        r.add({"warn", {parameter_shape::any, parameter_shape::any}}, noop(), "logging-b");
        FAIL() << "expected duplicate_signature_error";
    }catch(const duplicate_signature_error& e){
        EXPECT_EQ(e.code(), "E2000");
        EXPECT_EQ(e.signature, "warn(Any, Any)");
        std::string msg = e.what();
        EXPECT_NE(msg.find("logging-a"), std::string::npos);
        EXPECT_NE(msg.find("logging-b"), std::string::npos);
    }
    EXPECT_EQ(r.size(), 1u);
    // Same name, different shapes is an overload, not a duplicate.
    EXPECT_NO_THROW(r.add({"warn", {parameter_shape::literal, parameter_shape::any}}, noop()));
}

TEST(Registry, FrozenRegistryRejectsAdds){
    macro_registry r;
    r.add({"a", {}}, noop());
    r.freeze();
    EXPECT_TRUE(r.frozen());
    EXPECT_THROW(r.add({"b", {}}, noop()), registry_frozen_error);
    EXPECT_EQ(r.lookup("a").size(), 1u);
}

TEST(Registry, RejectsMissingImplementation){
    macro_registry r;
    EXPECT_THROW(r.add({"a", {}}, macro_impl{}), std::invalid_argument);
}

TEST(Registry, ReportsShadowedSignatures){
    macro_registry r;
    r.add({"m", {parameter_shape::any}}, noop(), "first");
    r.add({"m", {parameter_shape::literal}}, noop(), "second");
    r.add({"m", {parameter_shape::literal, parameter_shape::any}}, noop(), "third");
    r.add({"n", {parameter_shape::literal}}, noop(), "fourth");
    auto s = r.shadowed();
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s[0].first->origin, "first");
    EXPECT_EQ(s[0].second->origin, "second");
}
