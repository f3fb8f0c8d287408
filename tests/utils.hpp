#pragma once

#include "disnorm.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/grammar.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace disnorm::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    // Runs `fn` and hands back the disasm_error it threw, or nullopt when it returned normally
    inline std::optional<disasm_error> capture_error(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const disasm_error& e) {
            return e;
        }
        return std::nullopt;
    }

    inline std::optional<disasm_error> parse_error_of(std::string_view text) {
        return capture_error([text] { (void)disassembly::from_text(text); });
    }

    // The sample listing shape objdump prints with -d --no-addresses --no-show-raw-insn
    inline constexpr std::string_view sample_listing =
            "\n"
            "folder\\file:     file format some_format\n"
            "\n"
            "\n"
            "Disassembly of section sec1:\n"
            "\n"
            "<sym1>:\n"
            "\topc1\n"
            "\topc2    %opr1,%opr2\n"
            "\topc3    %opr3                   # comment1\n"
            "\n"
            "<sym2>:\n"
            "    opc4   %opr4  # comment2\n"
            "\n"
            "Disassembly of section sec2:\n"
            "\n"
            "<sym3>:\n";

}  // namespace disnorm::test::detail
