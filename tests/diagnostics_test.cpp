#include <gtest/gtest.h>
#include <sstream>
#include "synmacro/diagnostics.hpp"
#include "synmacro/diagnostics_json.hpp"

using namespace synmacro;

namespace {

source_span at(const std::string& file, int line, int col){
    source_span s;
    s.file = file;
    s.start_line = s.end_line = line;
    s.start_col = col;
    s.end_col = col + 4;
    return s;
}

} // namespace

TEST(DiagnosticsTest, FormatWithMacroAndLocation){
    diagnostic d;
    d.code = "E2001";
    d.macro = "warn";
    d.message = "boom";
    d.where = at("a.kt", 3, 7);
    EXPECT_EQ(format_diagnostic(d), "a.kt:3:7: warn: boom");
}

TEST(DiagnosticsTest, FormatFallsBackToUnitName){
    diagnostic d;
    d.macro = "m";
    d.message = "no span";
    d.unit = "b.kt";
    EXPECT_EQ(format_diagnostic(d), "b.kt: m: no span");
    d.unit.clear();
    d.macro.clear();
    EXPECT_EQ(format_diagnostic(d), "<unknown>: no span");
}

TEST(DiagnosticsTest, MacroErrorConversion){
    macro_execution_error e("bad argument", "cfg", at("c.kt", 1, 1));
    auto d = to_diagnostic(e, "c.kt");
    EXPECT_EQ(d.code, "E2001");
    EXPECT_EQ(d.severity, "error");
    EXPECT_EQ(d.macro, "cfg");
    EXPECT_EQ(d.unit, "c.kt");
    EXPECT_TRUE(d.notes.empty());
}

TEST(DiagnosticsTest, RecursionChainBecomesNotes){
    recursion_limit_error e(2, "b", at("r.kt", 5, 1), {{"a", at("r.kt", 2, 1)}, {"b", std::nullopt}});
    auto d = to_diagnostic(e, "r.kt");
    EXPECT_EQ(format_diagnostic(d),
              "r.kt:5:1: b: macro expansion exceeded the maximum depth of 2\n"
              "  note: r.kt:2:1: expanded from a\n"
              "  note: r.kt: expanded from b");
}

TEST(DiagnosticsTest, ParseErrorConversion){
    parse_error e("expected ')'", "p.kt", 4, 9);
    auto d = to_diagnostic(e, "p.kt");
    EXPECT_EQ(d.code, "E2004");
    EXPECT_EQ(format_diagnostic(d), "p.kt:4:9: expected ')'");

    parse_error unknown("io", "q.kt", 0, 0);
    EXPECT_EQ(format_diagnostic(to_diagnostic(unknown, "q.kt")), "q.kt: io");
}

TEST(DiagnosticsTest, SinkCountsAndEchoes){
    std::ostringstream echo;
    diagnostic_sink sink(&echo);
    diagnostic err;
    err.message = "first";
    err.unit = "u.kt";
    diagnostic warning;
    warning.severity = "warning";
    warning.message = "second";
    warning.unit = "u.kt";
    sink.report(err);
    sink.report(warning);
    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(sink.error_count(), 1u);
    EXPECT_EQ(sink.snapshot()[1].message, "second");
    EXPECT_EQ(echo.str(), "u.kt: first\nu.kt: second\n");
}

TEST(DiagnosticsTest, JsonEscape){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsTest, JsonDocument){
    diagnostic d;
    d.code = "E2002";
    d.macro = "m";
    d.message = "too deep";
    d.unit = "x.kt";
    d.where = at("x.kt", 2, 3);
    d.notes.push_back({"expanded from m", std::nullopt});
    diagnostic w;
    w.severity = "warning";
    w.code = "E2000";
    w.message = "shadowed";
    EXPECT_EQ(diagnostics_to_json(false, {d, w}),
              "{\"success\":false,\"errors\":[{\"code\":\"E2002\",\"macro\":\"m\",\"message\":\"too deep\",\"unit\":\"x.kt\","
              "\"file\":\"x.kt\",\"line\":2,\"col\":3,\"notes\":[{\"message\":\"expanded from m\",\"file\":null,\"line\":0,\"col\":0}]}],"
              "\"warnings\":[{\"code\":\"E2000\",\"macro\":\"\",\"message\":\"shadowed\",\"unit\":\"\","
              "\"file\":null,\"line\":0,\"col\":0,\"notes\":[]}]}");
    EXPECT_EQ(diagnostics_to_json(true, {}), "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}
