// Per-invocation state handed to a macro implementation.
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "synmacro/ast.hpp"
#include "synmacro/config.hpp"
#include "synmacro/errors.hpp"

namespace synmacro {

// ------ Scope view ------

struct scope_binding {
    enum class origin { declaration, parameter };
    origin from = origin::declaration;
    std::string name;
    node_ptr decl; // the declaration node; null for lambda parameters
};

// One syntactic scope (a block or a lambda's parameter list). Built by the driver as it
// walks; frames reference their parent and never outlive the walk that created them.
struct scope_frame {
    const scope_frame* parent = nullptr;
    std::vector<scope_binding> bindings;

    void declare(scope_binding b) { bindings.push_back(std::move(b)); }
};

// Lookup-only view of the enclosing scopes at a call site.
class scope_view {
public:
    scope_view() = default;
    explicit scope_view(const scope_frame* innermost) : frame_(innermost) {}

    // Innermost binding for name (later declarations shadow earlier ones).
    std::optional<scope_binding> lookup(const std::string& name) const;
    bool contains(const std::string& name) const { return lookup(name).has_value(); }
    // Visible names, innermost first, without duplicates.
    std::vector<std::string> names() const;

private:
    const scope_frame* frame_ = nullptr;
};

// ------ Fresh names ------

// Per-unit counter for generated identifiers.
class name_supply {
public:
    std::string next(const std::string& base) { return "__" + base + "_" + std::to_string(++n_); }

private:
    uint64_t n_ = 0;
};

// ------ Macro context ------

class macro_context {
public:
    macro_context(std::string macro, std::optional<source_span> call_span, scope_view scope,
                  compile_time_config config, int depth, name_supply* names = nullptr)
        : macro_(std::move(macro)), call_span_(std::move(call_span)), scope_(scope),
          config_(std::move(config)), depth_(depth), names_(names) {}

    const std::string& macro_name() const { return macro_; }
    const std::optional<source_span>& call_span() const { return call_span_; }
    // "file:line:column" of the call site, or "<unknown>".
    std::string location_string() const { return call_span_ ? to_string(*call_span_) : std::string("<unknown>"); }
    const scope_view& scope() const { return scope_; }
    const compile_time_config& config() const { return config_; }
    int depth() const { return depth_; }

    // Identifier unlikely to collide with user code. Not hygienic.
    std::string fresh_name(const std::string& base) const;

    [[noreturn]] void fail(const std::string& message) const {
        throw macro_execution_error(message, macro_, call_span_);
    }

private:
    std::string macro_;
    std::optional<source_span> call_span_;
    scope_view scope_;
    compile_time_config config_;
    int depth_ = 0;
    name_supply* names_ = nullptr;
};

// ------ Replacement result ------

// Either a replacement node or the explicit "delete this call" marker.
class replacement_result {
public:
    replacement_result(node_ptr n) : value_(std::move(n)) {}
    static replacement_result empty() {
        replacement_result r(nullptr);
        r.deleted_ = true;
        return r;
    }

    bool is_empty() const { return deleted_; }
    const node_ptr& value() const { return value_; }

private:
    node_ptr value_;
    bool deleted_ = false;
};

} // namespace synmacro
