#include "disnorm/error.hpp"

#include <utility>

using namespace disnorm::literals;

namespace disnorm {

    disasm_error::disasm_error(error_kind kind, const std::string& message, std::optional<std::string> line)
            : std::runtime_error{message}, kind_{kind}, line_{std::move(line)} {}

    disasm_error disasm_error::empty_input() {
        return disasm_error{error_kind::empty_input, "the input does not contain any text"};
    }

    disasm_error disasm_error::malformed_header(std::string_view line) {
        return disasm_error{
                error_kind::malformed_header, "incorrect format for the first line: '{}'"_format(line), std::string{line}};
    }

    disasm_error disasm_error::unrecognized_line(std::string_view line) {
        return disasm_error{
                error_kind::unrecognized_line,
                "unrecognized format for the following line: '{}'"_format(line),
                std::string{line}};
    }

    disasm_error disasm_error::missing_section(std::string_view entity) {
        return disasm_error{
                error_kind::missing_section, "attempted to add {} without first defining a section"_format(entity)};
    }

    disasm_error disasm_error::missing_symbol() {
        return disasm_error{
                error_kind::missing_symbol, "attempted to add an instruction without first defining a symbol"};
    }

    disasm_error disasm_error::io_failure(const std::string& message) {
        return disasm_error{error_kind::io_failure, message};
    }

}  // namespace disnorm
