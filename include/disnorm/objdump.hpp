#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace disnorm {

    struct objdump_request {
        std::filesystem::path objdump_path{"objdump"};
        std::filesystem::path object_path{};
        bool verbose{false};
    };

    struct objdump_result {
        std::vector<std::string> command{};
        int exit_code{-1};
        std::string stdout_text{};
        std::string stderr_text{};
    };

    // <objdump> -d --no-addresses --no-show-raw-insn <object>
    std::vector<std::string> build_objdump_command(const objdump_request& request);

    // Runs objdump to completion and captures both streams; only process plumbing failures throw
    objdump_result run_objdump(const objdump_request& request);

    // Returns objdump's stdout, or throws disasm_error(io_failure) when the tool is missing, writes anything to
    // stderr, or exits non-zero
    std::string load_disassembly_text(const objdump_request& request);

}  // namespace disnorm
