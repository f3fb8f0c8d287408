#pragma once

#include "symbol.hpp"

#include <string>
#include <vector>

namespace disnorm {

    class section {
      public:
        static constexpr bool to_string_formattable = true;

        section() = default;
        explicit section(std::string_view name);

        const std::string& name() const { return name_; }
        const std::vector<symbol>& symbols() const { return symbols_; }

        void add_symbol(symbol sym);

        // Appends to the last symbol; throws disasm_error(missing_symbol) when no symbol exists yet
        void add_instruction(instruction ins);

        // Last symbol added, or nullptr while the section is still empty
        symbol* current_symbol();

        // Stable lexicographic sort by symbol name; duplicate names keep their relative order
        void sort_symbols();

        std::string to_string(const render_options& opts = {}) const;

        bool operator==(const section&) const = default;

      private:
        std::string name_{};
        std::vector<symbol> symbols_{};
    };

}  // namespace disnorm
