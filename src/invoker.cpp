#include "synmacro/invoker.hpp"

namespace synmacro {

replacement_result invoke(const macro_definition& def, const call_site& site, const scope_view& scope,
                          const compile_time_config& config, int depth, name_supply* names) {
    const std::string& name = def.signature.name;
    macro_context ctx(name, site.span, scope, config, depth, names);

    auto run = [&]() -> replacement_result {
        try {
            return def.impl(ctx, site.args);
        } catch (macro_error& e) {
            e.attach(name, site.span);
            throw;
        } catch (const std::exception& e) {
            throw macro_execution_error(e.what(), name, site.span);
        } catch (...) {
            throw macro_execution_error("macro raised a non-standard exception", name, site.span);
        }
    };
    replacement_result r = run();
    if (r.is_empty()) return r;
    if (!r.value()) throw macro_execution_error("macro returned a null node", name, site.span);

    node_ptr out = clone(r.value());
    if (site.span) propagate_span(*out, *site.span);
    out->metadata[expanded_from_key] = name;
    return out;
}

} // namespace synmacro
