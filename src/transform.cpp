#include "synmacro/transform.hpp"
#include "synmacro/invoker.hpp"
#include "synmacro/parser.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>

namespace synmacro {

namespace {

node_ptr rebuild(const node& orig, node_data d) {
    auto out = std::make_shared<node>();
    out->data = std::move(d);
    out->span = orig.span;
    out->span_origin = orig.span_origin;
    out->metadata = orig.metadata;
    return out;
}

// Keeps the expansion chain in step with the recursion.
struct chain_guard {
    std::vector<recursion_limit_error::frame>& chain;
    chain_guard(std::vector<recursion_limit_error::frame>& c, recursion_limit_error::frame f) : chain(c) { chain.push_back(std::move(f)); }
    ~chain_guard() { chain.pop_back(); }
};

std::string where(const std::optional<source_span>& s) { return s ? to_string(*s) : std::string("<unknown>"); }

} // namespace

Expander::Expander(const macro_registry& registry, compile_time_config config, engine_options options)
    : registry_(registry), config_(std::move(config)), options_(options) {}

node_ptr Expander::expand(const node_ptr& unit) {
    if (!unit) throw std::invalid_argument("Expander::expand: null unit");
    chain_.clear();
    node_ptr work = clone(unit); // macros receive argument nodes; never hand them the caller's tree
    if (is_block(*work)) return expand_block(*work, 0, nullptr);
    return expand_expr(work, 0, nullptr);
}

const macro_definition* Expander::find_macro(const node_ptr& n, std::optional<call_site>& site) const {
    site = as_call_site(n);
    if (!site) return nullptr;
    auto candidates = registry_.lookup(site->name);
    auto def = match(*site, candidates);
    if (!def && options_.trace) {
        for (auto c : candidates)
            trace_log("match", where(site->span) + ": " + site->name + " stays a call, " + c->signature.to_string() + ": " +
                                   status_name(check(c->signature, *site)));
    }
    return def;
}

replacement_result Expander::run_macro(const macro_definition& def, const call_site& site, int depth, const scope_frame* scope) {
    if (depth >= options_.max_depth) throw recursion_limit_error(options_.max_depth, def.signature.name, site.span, chain_);
    if (options_.trace) trace_log("expand", where(site.span) + ": " + def.signature.to_string() + " depth " + std::to_string(depth));
    auto r = invoke(def, site, scope_view(scope), config_, depth, &names_);
    ++expansions_;
    return r;
}

node_ptr Expander::expand_expr(const node_ptr& n, int depth, const scope_frame* scope) {
    if (!n) return n;
    std::optional<call_site> site;
    if (auto def = find_macro(n, site)) {
        auto r = run_macro(*def, *site, depth, scope);
        if (r.is_empty()) {
            auto unit = n_ident("Unit");
            if (site->span) propagate_span(*unit, *site->span);
            unit->metadata[expanded_from_key] = def->signature.name;
            return unit;
        }
        chain_guard g(chain_, {def->signature.name, site->span});
        return expand_expr(r.value(), depth + 1, scope);
    }

    const node& cur = *n;
    return std::visit([&](const auto& arg) -> node_ptr {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, call>) {
            call c{expand_expr(arg.callee, depth, scope), {}, arg.trailing_lambda};
            for (auto& a : arg.args) c.args.push_back(expand_expr(a, depth, scope));
            return rebuild(cur, std::move(c));
        } else if constexpr (std::is_same_v<T, lambda>) {
            scope_frame params{scope, {}};
            for (auto& p : arg.params) params.declare({scope_binding::origin::parameter, p, nullptr});
            node_ptr body = arg.body && is_block(*arg.body) ? expand_block(*arg.body, depth, &params)
                                                            : expand_expr(arg.body, depth, &params);
            return rebuild(cur, lambda{arg.params, body});
        } else if constexpr (std::is_same_v<T, binary_op>) {
            return rebuild(cur, binary_op{arg.op, expand_expr(arg.lhs, depth, scope), expand_expr(arg.rhs, depth, scope)});
        } else if constexpr (std::is_same_v<T, unary_op>) {
            return rebuild(cur, unary_op{arg.op, expand_expr(arg.operand, depth, scope)});
        } else if constexpr (std::is_same_v<T, member>) {
            return rebuild(cur, member{expand_expr(arg.object, depth, scope), arg.name});
        } else if constexpr (std::is_same_v<T, declaration>) {
            return rebuild(cur, declaration{arg.is_mutable, arg.name, expand_expr(arg.init, depth, scope)});
        } else if constexpr (std::is_same_v<T, block>) {
            return expand_block(cur, depth, scope);
        } else {
            return n;
        }
    }, cur.data);
}

node_ptr Expander::expand_block(const node& n, int depth, const scope_frame* parent) {
    scope_frame frame{parent, {}};
    std::vector<node_ptr> out;
    for (auto& s : std::get<block>(n.data).stmts) expand_stmt(s, depth, frame, out);
    return rebuild(n, block{std::move(out)});
}

void Expander::expand_stmt(const node_ptr& n, int depth, scope_frame& scope, std::vector<node_ptr>& out) {
    if (!n) return;
    std::optional<call_site> site;
    if (auto def = find_macro(n, site)) {
        auto r = run_macro(*def, *site, depth, &scope);
        if (r.is_empty()) return;
        chain_guard g(chain_, {def->signature.name, site->span});
        const node_ptr& v = r.value();
        if (auto b = as_block(*v)) {
            for (auto& s : b->stmts) {
                if (s && !s->metadata.count(expanded_from_key)) s->metadata[expanded_from_key] = def->signature.name;
                expand_stmt(s, depth + 1, scope, out);
            }
        } else {
            expand_stmt(v, depth + 1, scope, out);
        }
        return;
    }
    if (auto d = std::get_if<declaration>(&n->data)) {
        auto decl = rebuild(*n, declaration{d->is_mutable, d->name, expand_expr(d->init, depth, &scope)});
        scope.declare({scope_binding::origin::declaration, d->name, decl});
        out.push_back(decl);
        return;
    }
    out.push_back(expand_expr(n, depth, &scope));
}

// ------ Program driver ------

std::vector<compilation_unit> program_result::expanded() const {
    std::vector<compilation_unit> out;
    for (auto& u : units)
        if (u.success) out.push_back({u.name, u.ast});
    return out;
}

namespace {

using unit_job = std::function<unit_result(Expander&)>;

program_result run_units(const std::vector<unit_job>& jobs, const macro_registry& registry, const config_store& config,
                         const engine_options& options, std::ostream* echo) {
    if (!registry.frozen()) throw std::logic_error("expand_program: the macro registry must be frozen before the pass");
    config_session session(config);
    diagnostic_sink sink(echo);
    std::vector<diagnostic> warnings;
    for (auto& [winner, loser] : registry.shadowed()) {
        diagnostic w;
        w.code = "W2000";
        w.severity = "warning";
        w.macro = loser->signature.name;
        w.unit = "<registry>";
        w.message = loser->signature.to_string() + (loser->origin.empty() ? "" : " (" + loser->origin + ")") +
                    " is never selected; " + winner->signature.to_string() +
                    (winner->origin.empty() ? "" : " (" + winner->origin + ")") + " was registered first";
        sink.report(w);
        warnings.push_back(std::move(w));
    }
    std::vector<unit_result> results(jobs.size());
    std::atomic<size_t> next{0};
    std::exception_ptr internal;
    std::mutex internal_mu;

    auto worker = [&]() {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            try {
                Expander ex(registry, session.capability(), options);
                results[i] = jobs[i](ex);
            } catch (...) {
                // Not a diagnosable unit failure; rethrown to the caller once all workers stop.
                std::lock_guard<std::mutex> lock(internal_mu);
                if (!internal) internal = std::current_exception();
                return;
            }
            for (auto& d : results[i].diagnostics) sink.report(d);
        }
    };

    size_t threads = static_cast<size_t>(std::max(1, options.jobs));
    threads = std::min(threads, jobs.size());
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
        for (auto& th : pool) th.join();
    }
    session.close();
    if (internal) std::rethrow_exception(internal);

    program_result out;
    out.diagnostics = std::move(warnings);
    for (auto& r : results) {
        if (!r.success) out.success = false;
        out.diagnostics.insert(out.diagnostics.end(), r.diagnostics.begin(), r.diagnostics.end());
        if (options.trace) trace_log("unit", r.name + (r.success ? ": ok, " + std::to_string(r.expansions) + " expansion(s)" : ": failed"));
    }
    out.units = std::move(results);
    return out;
}

unit_result expand_one(Expander& ex, const std::string& name, const node_ptr& ast) {
    unit_result r;
    r.name = name;
    try {
        r.ast = ex.expand(ast);
        r.success = true;
        r.expansions = ex.expansions();
    } catch (const macro_error& e) {
        r.diagnostics.push_back(to_diagnostic(e, name));
    }
    return r;
}

} // namespace

program_result expand_program(const std::vector<compilation_unit>& units, const macro_registry& registry,
                              const config_store& config, const engine_options& options, std::ostream* echo) {
    std::vector<unit_job> jobs;
    for (auto& u : units)
        jobs.push_back([&u](Expander& ex) { return expand_one(ex, u.name, u.ast); });
    return run_units(jobs, registry, config, options, echo);
}

program_result expand_sources(const std::vector<source_unit>& sources, const macro_registry& registry,
                              const config_store& config, const engine_options& options, std::ostream* echo) {
    std::vector<unit_job> jobs;
    for (auto& s : sources) {
        jobs.push_back([&s](Expander& ex) {
            node_ptr ast;
            try {
                ast = parse_unit(s.text, s.name);
            } catch (const parse_error& e) {
                unit_result r;
                r.name = s.name;
                r.diagnostics.push_back(to_diagnostic(e, s.name));
                return r;
            }
            return expand_one(ex, s.name, ast);
        });
    }
    return run_units(jobs, registry, config, options, echo);
}

} // namespace synmacro
