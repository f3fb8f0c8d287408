#include "disnorm/symbol.hpp"

#include <utility>

namespace disnorm {

    symbol::symbol(std::string_view name) : name_{utils::trim_view(name)} {}

    void symbol::add_instruction(instruction ins) {
        instructions_.push_back(std::move(ins));
    }

    std::string symbol::to_string(const render_options& opts) const {
        std::string body{};
        for (const auto& ins : instructions_) {
            body.append(ins.to_string(opts));
        }

        std::string rendered{name_};
        rendered.append(":\n");
        rendered.append(utils::indent_lines(body));
        return rendered;
    }

}  // namespace disnorm
