// Source spans attached to syntax nodes
#pragma once
#include <optional>
#include <string>

namespace synmacro {

struct node;

struct source_span {
    std::string file;
    int start_line = -1;
    int start_col = -1;
    int end_line = -1;
    int end_col = -1;

    bool known() const { return start_line >= 0; }
};

inline bool operator==(const source_span& a, const source_span& b) {
    return a.file == b.file && a.start_line == b.start_line && a.start_col == b.start_col &&
           a.end_line == b.end_line && a.end_col == b.end_col;
}
inline bool operator!=(const source_span& a, const source_span& b) { return !(a == b); }

// unset: not yet located (fresh node from a template or builder)
// parsed: assigned by the reader, immutable
// inherited: copied from a macro call site during expansion
// synthetic: deliberately location-free, never filled in
enum class span_state { unset, parsed, inherited, synthetic };

// Returns the node's span, or nullopt for unset / synthetic nodes.
std::optional<source_span> locate(const node& n);

// Assign a span exactly once. Throws std::logic_error if the node is already located or synthetic.
void attach_span(node& n, source_span s);

// Opt a node out of call-site span propagation.
void mark_synthetic(node& n);

// Fill every unset span in the subtree rooted at n with s (recursive).
void propagate_span(node& n, const source_span& s);

// "file:line:column" ("<unknown>" when the span is not known)
std::string to_string(const source_span& s);

} // namespace synmacro
