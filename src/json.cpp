#include "disnorm/json.hpp"

#include "disnorm/error.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

namespace disnorm {

    namespace detail {

        static internal::disassembly_payload make_payload(const disassembly& disasm) {
            internal::disassembly_payload payload{};
            payload.file_name = disasm.file_name();
            payload.file_format = disasm.file_format();
            payload.sections.reserve(disasm.sections().size());

            for (const auto& sec : disasm.sections()) {
                auto& sec_record = payload.sections.emplace_back();
                sec_record.name = sec.name();
                sec_record.symbols.reserve(sec.symbols().size());

                for (const auto& sym : sec.symbols()) {
                    auto& sym_record = sec_record.symbols.emplace_back();
                    sym_record.name = sym.name();
                    sym_record.instructions.reserve(sym.instructions().size());

                    for (const auto& ins : sym.instructions()) {
                        sym_record.instructions.push_back(internal::instruction_record{
                                .opcode = ins.opcode(), .operands = ins.operands(), .comment = ins.comment()});
                    }
                }
            }
            return payload;
        }

    }  // namespace detail

    std::string to_json(const disassembly& disasm) {
        auto payload = detail::make_payload(disasm);

        std::string json{};
        auto ec = glz::write_json(payload, json);
        if (ec) {
            throw disasm_error::io_failure("failed to serialize json payload");
        }
        json.push_back('\n');
        return json;
    }

}  // namespace disnorm
