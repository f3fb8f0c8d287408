#pragma once

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <vector>

namespace disnorm::internal {

    inline constexpr int supported_schema_version = 1;

    struct persisted_config {
        int schema_version{supported_schema_version};
        std::optional<std::string> objdump{};
        std::optional<std::string> output{};
        std::optional<bool> include_operands{};
        std::optional<bool> include_comments{};
    };

    struct instruction_record {
        std::string opcode{};
        std::string operands{};
        std::string comment{};
    };

    struct symbol_record {
        std::string name{};
        std::vector<instruction_record> instructions{};
    };

    struct section_record {
        std::string name{};
        std::vector<symbol_record> symbols{};
    };

    struct disassembly_payload {
        int schema_version{supported_schema_version};
        std::string file_name{};
        std::string file_format{};
        std::vector<section_record> sections{};
    };

}  // namespace disnorm::internal

namespace glz {

    template <>
    struct meta<disnorm::internal::persisted_config> {
        using T = disnorm::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "objdump",
                       &T::objdump,
                       "output",
                       &T::output,
                       "include_operands",
                       &T::include_operands,
                       "include_comments",
                       &T::include_comments);
    };

    template <>
    struct meta<disnorm::internal::instruction_record> {
        using T = disnorm::internal::instruction_record;
        static constexpr auto value = object("opcode", &T::opcode, "operands", &T::operands, "comment", &T::comment);
    };

    template <>
    struct meta<disnorm::internal::symbol_record> {
        using T = disnorm::internal::symbol_record;
        static constexpr auto value = object("name", &T::name, "instructions", &T::instructions);
    };

    template <>
    struct meta<disnorm::internal::section_record> {
        using T = disnorm::internal::section_record;
        static constexpr auto value = object("name", &T::name, "symbols", &T::symbols);
    };

    template <>
    struct meta<disnorm::internal::disassembly_payload> {
        using T = disnorm::internal::disassembly_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "file_name",
                       &T::file_name,
                       "file_format",
                       &T::file_format,
                       "sections",
                       &T::sections);
    };

}  // namespace glz
