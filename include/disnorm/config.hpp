#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace disnorm {

    using namespace std::string_view_literals;

    /*
     * disnorm Startup Config Options
     *
     * Input
     * - object_path: Object file or executable handed to objdump.
     * - input_path: Previously captured objdump text to normalize instead of running objdump ("-" for stdin).
     * - objdump_path: objdump executable; a bare name is searched on PATH.
     *
     * Output
     * - out_path: Destination file; stdout when unset.
     * - output: Rendering shape ("text" canonical listing or "json" tree).
     * - render.include_operands: Keep operands after the mnemonic in text output.
     * - render.include_comments: Keep trailing '#' comments in text output.
     *
     * Misc
     * - config_path: JSON file with persisted defaults; command-line flags take precedence.
     * - verbose: Log the objdump command line and a parse summary to stderr.
     * - print_config: Print resolved startup config and exit.
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv) || utils::str_case_eq(text, "txt"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    // Controls how much of each instruction survives in the canonical text rendering.
    // The defaults give opcode-only output.
    struct render_options {
        bool include_operands{false};
        bool include_comments{false};
    };

    struct startup_config {
        std::optional<std::filesystem::path> object_path{};
        std::optional<std::filesystem::path> input_path{};
        std::filesystem::path objdump_path{"objdump"};

        std::optional<std::filesystem::path> out_path{};
        output_mode output{output_mode::text};
        render_options render{};

        std::optional<std::filesystem::path> config_path{};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace disnorm
