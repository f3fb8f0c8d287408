#include "disnorm/instruction.hpp"

#include <utility>

namespace disnorm {

    instruction::instruction(std::string opcode, std::string operands, std::string comment)
            : opcode_{std::move(opcode)}, operands_{std::move(operands)}, comment_{std::move(comment)} {}

    std::string instruction::to_string(const render_options& opts) const {
        std::string rendered{opcode_};
        if (opts.include_operands && !operands_.empty()) {
            rendered.push_back(' ');
            rendered.append(operands_);
        }
        if (opts.include_comments && !comment_.empty()) {
            rendered.append(" # ");
            rendered.append(comment_);
        }
        rendered.push_back('\n');
        return rendered;
    }

}  // namespace disnorm
