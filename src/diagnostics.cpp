#include "synmacro/diagnostics.hpp"

#include <iostream>
#include <sstream>

namespace synmacro {

static std::string position(const std::optional<source_span>& where, const std::string& unit) {
    if (where && where->known()) return to_string(*where);
    return unit.empty() ? std::string("<unknown>") : unit;
}

std::string format_diagnostic(const diagnostic& d) {
    std::ostringstream os;
    os << position(d.where, d.unit) << ": ";
    if (!d.macro.empty()) os << d.macro << ": ";
    os << d.message;
    for (auto& n : d.notes) os << "\n  note: " << position(n.where, d.unit) << ": " << n.message;
    return os.str();
}

diagnostic to_diagnostic(const macro_error& e, const std::string& unit) {
    diagnostic d;
    d.code = e.code();
    d.macro = e.macro();
    d.message = e.message();
    d.where = e.where();
    d.unit = unit;
    if (auto r = dynamic_cast<const recursion_limit_error*>(&e)) {
        for (auto& f : r->chain) d.notes.push_back({"expanded from " + f.macro, f.where});
    }
    return d;
}

diagnostic to_diagnostic(const parse_error& e, const std::string& unit) {
    diagnostic d;
    d.code = "E2004";
    d.message = e.what();
    d.unit = unit;
    if (e.line > 0) {
        source_span s;
        s.file = e.file;
        s.start_line = s.end_line = e.line;
        s.start_col = s.end_col = e.column;
        d.where = s;
    }
    return d;
}

void diagnostic_sink::report(diagnostic d) {
    std::lock_guard<std::mutex> lock(mu_);
    if (echo_) *echo_ << format_diagnostic(d) << '\n';
    diags_.push_back(std::move(d));
}

std::vector<diagnostic> diagnostic_sink::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return diags_;
}

size_t diagnostic_sink::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return diags_.size();
}

size_t diagnostic_sink::error_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (auto& d : diags_)
        if (d.severity == "error") ++n;
    return n;
}

void trace_log(const std::string& component, const std::string& message) {
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << "[synmacro][" << component << "] " << message << "\n";
}

} // namespace synmacro
