#pragma once

#include "disnorm/utils.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

// Line grammars for `objdump -d --no-addresses --no-show-raw-insn` output
namespace disnorm::internal::grammar {

    using namespace std::string_view_literals;

    inline constexpr auto section_marker_prefix = "Disassembly of section "sv;
    inline constexpr auto header_format_prefix = "file format "sv;
    inline constexpr auto symbol_marker_suffix = ">:"sv;

    struct header_fields {
        std::string_view file_name{};
        std::string_view file_format{};
    };

    struct instruction_fields {
        std::string_view opcode{};
        std::string_view operands{};
        std::string_view comment{};
    };

    constexpr bool is_section_name_char(char c) noexcept {
        return utils::is_alnum(c) || c == '.';
    }

    constexpr bool is_opcode_char(char c) noexcept {
        return utils::is_lower(c) || utils::is_digit(c) || utils::is_space(c);
    }

    // "<file name>:   file format <format>"; the file name is kept verbatim up to the first ':'
    constexpr std::optional<header_fields> match_header(std::string_view line) {
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }

        auto rest = utils::trim_view(line.substr(colon + 1U));
        if (!rest.starts_with(header_format_prefix)) {
            return std::nullopt;
        }
        return header_fields{
                .file_name = line.substr(0U, colon),
                .file_format = utils::trim_view(rest.substr(header_format_prefix.size()))};
    }

    constexpr bool looks_like_section_marker(std::string_view line) {
        return utils::trim_view(line).starts_with(section_marker_prefix);
    }

    constexpr std::optional<std::string_view> match_section_marker(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (!trimmed.starts_with(section_marker_prefix) || !trimmed.ends_with(':')) {
            return std::nullopt;
        }

        auto name = trimmed.substr(section_marker_prefix.size(), trimmed.size() - section_marker_prefix.size() - 1U);
        if (name.empty() || !std::ranges::all_of(name, is_section_name_char)) {
            return std::nullopt;
        }
        return name;
    }

    constexpr bool looks_like_symbol_marker(std::string_view line) {
        return utils::trim_view(line).ends_with(symbol_marker_suffix);
    }

    // "<name>:" with a non-empty name; the returned view keeps both angle brackets
    constexpr std::optional<std::string_view> match_symbol_marker(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (trimmed.size() < 4U || trimmed.front() != '<' || !trimmed.ends_with(symbol_marker_suffix)) {
            return std::nullopt;
        }
        return trimmed.substr(0U, trimmed.size() - 1U);
    }

    /*
     * Instruction lines always start with whitespace. Everything after the first '#' is the comment. The rest is a
     * mnemonic, possibly multi-word ("bnd jmp", "rep stos"), optionally followed by one operand token after the last
     * whitespace run. The mnemonic is restricted to lowercase letters, digits and interior whitespace.
     */
    constexpr std::optional<instruction_fields> match_instruction(std::string_view line) {
        if (line.empty() || !utils::is_space(line.front())) {
            return std::nullopt;
        }

        auto left = line;
        std::string_view comment{};
        if (auto hash = line.find('#'); hash != std::string_view::npos) {
            left = line.substr(0U, hash);
            comment = utils::trim_view(line.substr(hash + 1U));
        }

        left = utils::trim_view(left);
        if (left.empty()) {
            return std::nullopt;
        }

        if (std::ranges::all_of(left, is_opcode_char)) {
            return instruction_fields{.opcode = left, .operands = {}, .comment = comment};
        }

        auto split = left.find_last_of(utils::whitespace_chars);
        if (split == std::string_view::npos) {
            return std::nullopt;
        }

        auto opcode = utils::trim_view(left.substr(0U, split));
        if (opcode.empty() || !std::ranges::all_of(opcode, is_opcode_char)) {
            return std::nullopt;
        }
        return instruction_fields{.opcode = opcode, .operands = left.substr(split + 1U), .comment = comment};
    }

}  // namespace disnorm::internal::grammar
