// Error taxonomy for the expansion pass.
// Codes: E2000 duplicate signature, E2001 macro execution, E2002 recursion limit,
//        E2003 unresolved template hole, E2004 parse error.
// W2000 (warning) marks a registration that can never be selected.
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "synmacro/location.hpp"

namespace synmacro {

struct parse_error : std::runtime_error {
    parse_error(const std::string& message, std::string file, int line, int column)
        : std::runtime_error(message), file(std::move(file)), line(line), column(column) {}
    std::string file;
    int line = 0;
    int column = 0;
};

class macro_error : public std::runtime_error {
public:
    macro_error(std::string code, const std::string& message, std::string macro = {}, std::optional<source_span> where = {})
        : std::runtime_error(message), code_(std::move(code)), macro_(std::move(macro)), where_(std::move(where)) {}

    const std::string& code() const { return code_; }
    const std::string& macro() const { return macro_; }
    const std::optional<source_span>& where() const { return where_; }
    std::string message() const { return what(); }

    // Fill in macro name / call-site location if the raiser did not know them.
    void attach(const std::string& macro, const std::optional<source_span>& where) {
        if (macro_.empty()) macro_ = macro;
        if (!where_ && where) where_ = where;
    }

private:
    std::string code_;
    std::string macro_;
    std::optional<source_span> where_;
};

// Registration time; fatal for the whole run.
struct duplicate_signature_error : macro_error {
    duplicate_signature_error(const std::string& signature, const std::string& origin, const std::string& first_origin)
        : macro_error("E2000", "duplicate macro signature " + signature +
                                   (origin.empty() ? std::string() : " registered by " + origin) +
                                   (first_origin.empty() ? std::string() : "; first registered by " + first_origin)),
          signature(signature) {}
    std::string signature;
};

struct macro_execution_error : macro_error {
    macro_execution_error(const std::string& message, std::string macro = {}, std::optional<source_span> where = {})
        : macro_error("E2001", message, std::move(macro), std::move(where)) {}
};

struct recursion_limit_error : macro_error {
    struct frame { std::string macro; std::optional<source_span> where; };
    recursion_limit_error(int limit, std::string macro, std::optional<source_span> where, std::vector<frame> chain)
        : macro_error("E2002", "macro expansion exceeded the maximum depth of " + std::to_string(limit),
                      std::move(macro), std::move(where)),
          limit(limit), chain(std::move(chain)) {}
    int limit;
    std::vector<frame> chain; // outermost expansion first
};

struct unresolved_hole_error : macro_error {
    explicit unresolved_hole_error(std::vector<std::string> holes)
        : macro_error("E2003", "unresolved template hole(s): " + join(holes)), holes(std::move(holes)) {}
    std::vector<std::string> holes;

private:
    static std::string join(const std::vector<std::string>& xs) {
        std::string out;
        for (size_t i = 0; i < xs.size(); ++i) {
            if (i) out += ", ";
            out += xs[i];
        }
        return out;
    }
};

struct registry_frozen_error : std::logic_error {
    using std::logic_error::logic_error;
};

// Compile-time configuration read outside the expansion pass.
struct config_unavailable_error : std::logic_error {
    using std::logic_error::logic_error;
};

} // namespace synmacro
