#include "disnorm/disassembly.hpp"

#include "disnorm/error.hpp"

#include "internal/grammar.hpp"

#include <algorithm>
#include <utility>

namespace disnorm {

    disassembly::disassembly(std::string file_name, std::string file_format)
            : file_name_{std::move(file_name)}, file_format_{std::move(file_format)} {}

    disassembly disassembly::from_text(std::string_view text) {
        auto lines = utils::split_lines(text);
        return parse(lines);
    }

    disassembly disassembly::from_lines(std::span<const std::string> lines) {
        std::vector<std::string_view> views{};
        views.reserve(lines.size());
        for (const auto& line : lines) {
            views.emplace_back(line);
        }
        return parse(views);
    }

    disassembly disassembly::parse(std::span<const std::string_view> lines) {
        disassembly disasm{};

        // line numbers stay 1-based over the unfiltered input
        size_t index = 0U;
        auto next_non_blank = [&]() -> const std::string_view* {
            while (index < lines.size()) {
                const auto* line = &lines[index++];
                if (!utils::is_blank(*line)) {
                    return line;
                }
            }
            return nullptr;
        };

        const auto* line = next_non_blank();
        if (line == nullptr) {
            throw disasm_error::empty_input();
        }

        try {
            disasm.process_first_line(*line);
            while ((line = next_non_blank()) != nullptr) {
                disasm.process_other_line(*line);
            }
        } catch (disasm_error& e) {
            if (!e.line_number()) {
                e.set_line_number(index);
            }
            throw;
        }

        disasm.sort_sections();
        debug_log("parsed ", disasm.sections_.size(), " sections, ", disasm.symbol_count(), " symbols");
        return disasm;
    }

    void disassembly::process_first_line(std::string_view line) {
        auto header = internal::grammar::match_header(line);
        if (!header) {
            throw disasm_error::malformed_header(line);
        }
        file_name_ = std::string{header->file_name};
        file_format_ = std::string{header->file_format};
    }

    void disassembly::process_other_line(std::string_view line) {
        namespace grammar = internal::grammar;

        if (auto name = grammar::match_section_marker(line)) {
            add_section(section{*name});
            return;
        }
        // a malformed section or symbol marker must never fall through to the instruction grammar
        if (grammar::looks_like_section_marker(line)) {
            throw disasm_error::unrecognized_line(line);
        }

        if (auto name = grammar::match_symbol_marker(line)) {
            add_symbol(symbol{*name});
            return;
        }
        if (grammar::looks_like_symbol_marker(line)) {
            throw disasm_error::unrecognized_line(line);
        }

        if (auto fields = grammar::match_instruction(line)) {
            add_instruction(instruction{
                    std::string{fields->opcode}, std::string{fields->operands}, std::string{fields->comment}});
            return;
        }

        throw disasm_error::unrecognized_line(line);
    }

    void disassembly::add_section(section sec) {
        sections_.push_back(std::move(sec));
    }

    section* disassembly::current_section() {
        if (sections_.empty()) {
            return nullptr;
        }
        return &sections_.back();
    }

    void disassembly::add_symbol(symbol sym) {
        auto* target = current_section();
        if (target == nullptr) {
            throw disasm_error::missing_section("a symbol");
        }
        target->add_symbol(std::move(sym));
    }

    void disassembly::add_instruction(instruction ins) {
        auto* target = current_section();
        if (target == nullptr) {
            throw disasm_error::missing_section("an instruction");
        }
        target->add_instruction(std::move(ins));
    }

    void disassembly::sort_sections() {
        for (auto& sec : sections_) {
            sec.sort_symbols();
        }
        std::ranges::stable_sort(sections_, {}, &section::name);
    }

    size_t disassembly::symbol_count() const {
        size_t count = 0U;
        for (const auto& sec : sections_) {
            count += sec.symbols().size();
        }
        return count;
    }

    size_t disassembly::instruction_count() const {
        size_t count = 0U;
        for (const auto& sec : sections_) {
            for (const auto& sym : sec.symbols()) {
                count += sym.instructions().size();
            }
        }
        return count;
    }

    std::string disassembly::to_string(const render_options& opts) const {
        std::string rendered{};
        for (const auto& sec : sections_) {
            rendered.append(sec.to_string(opts));
        }
        return rendered;
    }

}  // namespace disnorm
