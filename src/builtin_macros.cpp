#include "synmacro/builtin_macros.hpp"
#include "synmacro/declare.hpp"
#include "synmacro/template.hpp"

namespace synmacro {

namespace {

const quasi_template& warn_template() {
    static const quasi_template t = parse_template("!($cond) && println(@location + \": \" + $msg)");
    return t;
}

const source_span& require_span(const macro_context& ctx) {
    if (!ctx.call_span()) ctx.fail("call site has no source location");
    return *ctx.call_span();
}

void register_diagnostic_macros(macro_registry& r) {
    r.add(make_macro("warn", [](const macro_context& ctx, expression cond, expression msg) -> replacement_result {
        if (!ctx.config().flag("warnings")) return replacement_result::empty();
        return materialize(warn_template(), {{"cond", cond.get()}, {"msg", msg.get()}}, {{"location", ctx.location_string()}});
    }, builtin_origin));
}

void register_source_macros(macro_registry& r) {
    r.add(make_macro("stringify", [](expression e) -> node_ptr { return n_str(to_string(e.get())); }, builtin_origin));

    r.add(make_macro("file", [](const macro_context& ctx) -> node_ptr { return n_str(require_span(ctx).file); }, builtin_origin));

    r.add(make_macro("line", [](const macro_context& ctx) -> node_ptr { return n_int(require_span(ctx).start_line); }, builtin_origin));
}

void register_config_macros(macro_registry& r) {
    r.add(make_macro("cfg", [](const macro_context& ctx, literal_expr key) -> node_ptr {
        auto name = key.string_value();
        if (!name) ctx.fail("cfg expects a string literal naming a configuration key, got " + to_string(key.get()));
        return n_bool(ctx.config().flag(*name));
    }, builtin_origin));

    r.add(make_macro("debugOnly", [](const macro_context& ctx, lambda_expr body) -> replacement_result {
        if (!ctx.config().flag("debug")) return replacement_result::empty();
        if (!body.params().empty()) ctx.fail("debugOnly takes a lambda without parameters");
        return n_block(body.body());
    }, builtin_origin));
}

} // namespace

void register_builtin_macros(macro_registry& registry) {
    register_diagnostic_macros(registry);
    register_source_macros(registry);
    register_config_macros(registry);
}

} // namespace synmacro
