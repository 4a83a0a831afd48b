#include "synmacro/context.hpp"

#include <algorithm>
#include <atomic>

namespace synmacro {

std::optional<scope_binding> scope_view::lookup(const std::string& name) const {
    for (auto f = frame_; f; f = f->parent) {
        for (auto it = f->bindings.rbegin(); it != f->bindings.rend(); ++it)
            if (it->name == name) return *it;
    }
    return std::nullopt;
}

std::vector<std::string> scope_view::names() const {
    std::vector<std::string> out;
    for (auto f = frame_; f; f = f->parent) {
        for (auto it = f->bindings.rbegin(); it != f->bindings.rend(); ++it)
            if (std::find(out.begin(), out.end(), it->name) == out.end()) out.push_back(it->name);
    }
    return out;
}

std::string macro_context::fresh_name(const std::string& base) const {
    if (names_) return names_->next(base);
    // Contexts built outside a pass (tests, tools) share one process-wide counter.
    static std::atomic<uint64_t> n{0};
    return "__" + base + "_g" + std::to_string(++n);
}

} // namespace synmacro
