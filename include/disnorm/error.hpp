#pragma once

#include "format.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace disnorm {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        empty_input,
        malformed_header,
        unrecognized_line,
        missing_section,
        missing_symbol,
        io_failure,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::empty_input:
                return "empty_input"sv;
            case error_kind::malformed_header:
                return "malformed_header"sv;
            case error_kind::unrecognized_line:
                return "unrecognized_line"sv;
            case error_kind::missing_section:
                return "missing_section"sv;
            case error_kind::missing_symbol:
                return "missing_symbol"sv;
            case error_kind::io_failure:
                return "io_failure"sv;
        }
        return "io_failure"sv;
    }

    /*
     * Single exception type for every failure the normalizer reports.
     *
     * The parse is fail-fast: the first offending line aborts it and no partial tree escapes. `line()` holds the
     * verbatim offending text for header and body grammar failures; `line_number()` is the 1-based position in the
     * original input (blank lines included) once the tree builder has attached it.
     */
    class disasm_error : public std::runtime_error {
      public:
        disasm_error(error_kind kind, const std::string& message, std::optional<std::string> line = std::nullopt);

        error_kind kind() const noexcept { return kind_; }
        const std::optional<std::string>& line() const noexcept { return line_; }
        std::optional<size_t> line_number() const noexcept { return line_number_; }

        void set_line_number(size_t line_number) noexcept { line_number_ = line_number; }

        static disasm_error empty_input();
        static disasm_error malformed_header(std::string_view line);
        static disasm_error unrecognized_line(std::string_view line);
        static disasm_error missing_section(std::string_view entity);
        static disasm_error missing_symbol();
        static disasm_error io_failure(const std::string& message);

      private:
        error_kind kind_;
        std::optional<std::string> line_{};
        std::optional<size_t> line_number_{};
    };

}  // namespace disnorm
