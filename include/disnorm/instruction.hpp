#pragma once

#include "config.hpp"
#include "format.hpp"

#include <string>

namespace disnorm {

    // One disassembled line reduced to its salient fields. Immutable once built.
    class instruction {
      public:
        static constexpr bool to_string_formattable = true;

        instruction() = default;
        explicit instruction(std::string opcode, std::string operands = {}, std::string comment = {});

        const std::string& opcode() const { return opcode_; }
        const std::string& operands() const { return operands_; }
        const std::string& comment() const { return comment_; }

        // "<opcode>\n", optionally followed (before the newline) by " <operands>" and " # <comment>"
        std::string to_string(const render_options& opts = {}) const;

        bool operator==(const instruction&) const = default;

      private:
        std::string opcode_{};
        std::string operands_{};
        std::string comment_{};
    };

}  // namespace disnorm
