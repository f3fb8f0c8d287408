#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace disnorm::cli {

    // Returns an exit code when the process should stop right away (help, version, bad arguments, --print-config)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Loads persisted defaults from a JSON config file into `cfg`; throws disasm_error(io_failure) on any failure
    void apply_config_file(const std::filesystem::path& path, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

    // Acquires the disassembly text, normalizes it and writes the result; returns the process exit code
    int run(const startup_config& cfg);

}  // namespace disnorm::cli
