#pragma once

#include "section.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace disnorm {

    /*
     * Root of the normalized tree: file metadata plus its sections.
     *
     * `from_text` / `from_lines` run the single-pass parser: blank lines are dropped, the first remaining line must be
     * the "<file>: file format <fmt>" header, and every later line is a section marker, a symbol marker or an
     * instruction, in that order of precedence. Any grammar or ordering violation throws disasm_error for the first
     * offending line. On success sections and symbols are sorted by name exactly once before returning.
     */
    class disassembly {
      public:
        static constexpr bool to_string_formattable = true;

        disassembly() = default;
        disassembly(std::string file_name, std::string file_format);

        static disassembly from_text(std::string_view text);
        static disassembly from_lines(std::span<const std::string> lines);

        const std::string& file_name() const { return file_name_; }
        const std::string& file_format() const { return file_format_; }
        const std::vector<section>& sections() const { return sections_; }

        void add_section(section sec);

        // Throws disasm_error(missing_section) when no section exists yet
        void add_symbol(symbol sym);

        // Throws disasm_error(missing_section) or disasm_error(missing_symbol)
        void add_instruction(instruction ins);

        // Last section added, or nullptr before the first section marker
        section* current_section();

        // Sorts every section's symbols, then the sections themselves; idempotent
        void sort_sections();

        size_t symbol_count() const;
        size_t instruction_count() const;

        std::string to_string(const render_options& opts = {}) const;

        bool operator==(const disassembly&) const = default;

      private:
        static disassembly parse(std::span<const std::string_view> lines);

        void process_first_line(std::string_view line);
        void process_other_line(std::string_view line);

        std::string file_name_{};
        std::string file_format_{};
        std::vector<section> sections_{};
    };

}  // namespace disnorm
