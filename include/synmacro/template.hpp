// Quasiquote templates: code skeletons with named holes.
//   $name  ExpressionSplice - embeds a captured subtree verbatim
//   @name  ValueSplice      - embeds a scalar as a literal node
#pragma once
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "synmacro/ast.hpp"
#include "synmacro/errors.hpp"

namespace synmacro {

using expression_bindings = std::map<std::string, node_ptr>;
using value_bindings = std::map<std::string, scalar>;

enum class template_form { expression, statements };

struct template_hole {
    hole_kind kind;
    std::string name;
};

// Immutable once built; safe to share between threads.
class quasi_template {
public:
    quasi_template(std::shared_ptr<const node> skeleton, std::string source, template_form form);

    const node& skeleton() const { return *skeleton_; }
    const std::string& source() const { return source_; }
    template_form form() const { return form_; }
    // Distinct holes in first-occurrence order.
    const std::vector<template_hole>& holes() const { return holes_; }

private:
    std::shared_ptr<const node> skeleton_;
    std::string source_;
    template_form form_;
    std::vector<template_hole> holes_;
};

// Throws parse_error on malformed template text.
quasi_template parse_template(std::string_view source, template_form form = template_form::expression);

// Fill every hole. Throws unresolved_hole_error naming all unbound holes; no partial output.
// Expression splices are deep copies of the bound subtree (spans kept); template nodes
// themselves carry no span.
node_ptr materialize(const quasi_template& t, const expression_bindings& exprs, const value_bindings& values = {});

// parse_template + materialize in one step.
node_ptr quote(std::string_view source, const expression_bindings& exprs, const value_bindings& values = {});

} // namespace synmacro
