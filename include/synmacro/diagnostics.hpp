#pragma once
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "synmacro/errors.hpp"
#include "synmacro/location.hpp"

namespace synmacro {

struct diagnostic_note {
    std::string message;
    std::optional<source_span> where;
};

struct diagnostic {
    std::string code;     // E2000..E2004, W2000 for a registration never selected
    std::string severity = "error";
    std::string macro;    // empty for reader errors
    std::string message;
    std::optional<source_span> where;
    std::string unit;     // compilation unit name
    std::vector<diagnostic_note> notes;
};

// "<file>:<line>:<column>: <macroName>: <message>", followed by one indented line per note.
// Without a location the unit name stands in for the position; without a macro the
// name segment is dropped.
std::string format_diagnostic(const diagnostic& d);

diagnostic to_diagnostic(const macro_error& e, const std::string& unit);
diagnostic to_diagnostic(const parse_error& e, const std::string& unit);

// Thread-safe collector shared by units expanded in parallel.
class diagnostic_sink {
public:
    explicit diagnostic_sink(std::ostream* echo = nullptr) : echo_(echo) {}

    void report(diagnostic d);
    std::vector<diagnostic> snapshot() const;
    size_t size() const;
    size_t error_count() const;

private:
    mutable std::mutex mu_;
    std::vector<diagnostic> diags_;
    std::ostream* echo_;
};

// "[synmacro][<component>] <message>" on stderr, one line per call, serialized.
void trace_log(const std::string& component, const std::string& message);

} // namespace synmacro
