#include "disnorm/section.hpp"

#include "disnorm/error.hpp"

#include <algorithm>
#include <utility>

namespace disnorm {

    section::section(std::string_view name) : name_{utils::trim_view(name)} {}

    void section::add_symbol(symbol sym) {
        symbols_.push_back(std::move(sym));
    }

    symbol* section::current_symbol() {
        if (symbols_.empty()) {
            return nullptr;
        }
        return &symbols_.back();
    }

    void section::add_instruction(instruction ins) {
        auto* target = current_symbol();
        if (target == nullptr) {
            throw disasm_error::missing_symbol();
        }
        target->add_instruction(std::move(ins));
    }

    void section::sort_symbols() {
        std::ranges::stable_sort(symbols_, {}, &symbol::name);
    }

    std::string section::to_string(const render_options& opts) const {
        std::string body{};
        for (const auto& sym : symbols_) {
            body.append(sym.to_string(opts));
        }

        std::string rendered{name_};
        rendered.append(":\n");
        rendered.append(utils::indent_lines(body));
        return rendered;
    }

}  // namespace disnorm
