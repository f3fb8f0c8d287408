#pragma once

#include "instruction.hpp"

#include <string>
#include <vector>

namespace disnorm {

    // A named label boundary owning its instructions in source order. Instructions are never re-sorted.
    class symbol {
      public:
        static constexpr bool to_string_formattable = true;

        symbol() = default;
        explicit symbol(std::string_view name);

        const std::string& name() const { return name_; }
        const std::vector<instruction>& instructions() const { return instructions_; }

        void add_instruction(instruction ins);

        std::string to_string(const render_options& opts = {}) const;

        bool operator==(const symbol&) const = default;

      private:
        std::string name_{};
        std::vector<instruction> instructions_{};
    };

}  // namespace disnorm
