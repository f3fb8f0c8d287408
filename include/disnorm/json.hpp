#pragma once

#include "disassembly.hpp"

#include <string>

namespace disnorm {

    // Lossless JSON view of a parsed tree, including file metadata, operands and comments
    std::string to_json(const disassembly& disasm);

}  // namespace disnorm
