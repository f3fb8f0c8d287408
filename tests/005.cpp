#include "utils.hpp"

namespace disnorm::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: input without any text is rejected", "[005][error]") {
        for (auto text : {""sv, "\n"sv, "   \n\t\n\r\n"sv}) {
            auto err = detail::parse_error_of(text);
            REQUIRE(err);
            CHECK(err->kind() == error_kind::empty_input);
            CHECK(std::string_view{err->what()} == "the input does not contain any text"sv);
            CHECK_FALSE(err->line_number());
        }

        std::vector<std::string> no_lines{};
        auto err = detail::capture_error([&] { (void)disassembly::from_lines(no_lines); });
        REQUIRE(err);
        CHECK(err->kind() == error_kind::empty_input);
    }

    TEST_CASE("005: malformed header lines", "[005][error][header]") {
        auto garbage = detail::parse_error_of("New line with incorrect formatting"sv);
        REQUIRE(garbage);
        CHECK(garbage->kind() == error_kind::malformed_header);
        REQUIRE(garbage->line());
        CHECK(*garbage->line() == "New line with incorrect formatting");
        CHECK(garbage->line_number() == std::optional<size_t>{1U});

        auto no_prefix = detail::parse_error_of("\n\nfile.o: format elf64-x86-64\n"sv);
        REQUIRE(no_prefix);
        CHECK(no_prefix->kind() == error_kind::malformed_header);
        CHECK(no_prefix->line_number() == std::optional<size_t>{3U});

        auto garbage_text = detail::parse_error_of("garbage text"sv);
        REQUIRE(garbage_text);
        CHECK(garbage_text->kind() == error_kind::malformed_header);
    }

    TEST_CASE("005: section marker with the wrong fixed text", "[005][error][section]") {
        auto err = detail::parse_error_of(
                "folder\\file:     file format some_format\n"
                "gibberish of section sec1:\n"sv);
        REQUIRE(err);
        CHECK(err->kind() == error_kind::unrecognized_line);
        REQUIRE(err->line());
        CHECK(*err->line() == "gibberish of section sec1:");
        CHECK(std::string_view{err->what()} ==
              "unrecognized format for the following line: 'gibberish of section sec1:'"sv);
        CHECK(err->line_number() == std::optional<size_t>{2U});
    }

    TEST_CASE("005: section marker with a strange name never becomes an instruction", "[005][error][section]") {
        for (auto line : {"Disassembly of section sec%1:"sv,
                          "\tDisassembly of section sec%1:"sv,
                          "Disassembly of section sec 1:"sv,
                          "Disassembly of section :"sv,
                          "Disassembly of section .text: trailing"sv}) {
            std::string text{"folder\\file:     file format some_format\n"};
            text.append(line);
            text.push_back('\n');

            auto err = detail::parse_error_of(text);
            REQUIRE(err);
            CHECK(err->kind() == error_kind::unrecognized_line);
            REQUIRE(err->line());
            CHECK(*err->line() == line);
        }
    }

    TEST_CASE("005: malformed symbol markers", "[005][error][symbol]") {
        for (auto line : {"sym1>:"sv, "<sym1"sv, "foo <sym1>:"sv, "  foo <sym1>:"sv, "<sym1>: extra"sv, "<>:"sv}) {
            std::string text{"folder\\file:     file format some_format\nDisassembly of section sec1:\n"};
            text.append(line);
            text.push_back('\n');

            auto err = detail::parse_error_of(text);
            REQUIRE(err);
            CHECK(err->kind() == error_kind::unrecognized_line);
            REQUIRE(err->line());
            CHECK(*err->line() == line);
            CHECK(err->line_number() == std::optional<size_t>{3U});
        }
    }

    TEST_CASE("005: instruction lines need leading whitespace and a lowercase mnemonic", "[005][error][instruction]") {
        auto missing_space = detail::parse_error_of(
                "folder\\file:     file format some_format\n"
                "Disassembly of section sec1:\n"
                "<sym1>:\n"
                "opc1 opc2    %opr1,%opr2          # comment1\n"sv);
        REQUIRE(missing_space);
        CHECK(missing_space->kind() == error_kind::unrecognized_line);
        CHECK(*missing_space->line() == "opc1 opc2    %opr1,%opr2          # comment1");

        auto uppercase = detail::parse_error_of(
                "folder\\file:     file format some_format\n"
                "Disassembly of section sec1:\n"
                "<sym1>:\n"
                "\tOpc1 opc2    %opr1,%opr2          # comment1\n"sv);
        REQUIRE(uppercase);
        CHECK(uppercase->kind() == error_kind::unrecognized_line);
        CHECK(*uppercase->line() == "\tOpc1 opc2    %opr1,%opr2          # comment1");

        auto short_line = detail::parse_error_of(
                "f: file format fmt\n"
                "Disassembly of section sec1:\n"
                "<sym1>:\n"
                "opc1 opc2\n"sv);
        REQUIRE(short_line);
        CHECK(short_line->kind() == error_kind::unrecognized_line);
        CHECK(short_line->line_number() == std::optional<size_t>{4U});
    }

    TEST_CASE("005: symbol before any section", "[005][error][order]") {
        auto err = detail::parse_error_of(
                "folder\\file:     file format some_format\n"
                "\n"
                "<sym1>:\n"sv);
        REQUIRE(err);
        CHECK(err->kind() == error_kind::missing_section);
        CHECK(std::string_view{err->what()} == "attempted to add a symbol without first defining a section"sv);
        CHECK_FALSE(err->line());
        CHECK(err->line_number() == std::optional<size_t>{3U});
    }

    TEST_CASE("005: instruction before any section", "[005][error][order]") {
        auto err = detail::parse_error_of(
                "folder\\file:     file format some_format\n"
                "\n"
                "\topc1\n"sv);
        REQUIRE(err);
        CHECK(err->kind() == error_kind::missing_section);
        CHECK(std::string_view{err->what()} == "attempted to add an instruction without first defining a section"sv);
    }

    TEST_CASE("005: instruction before any symbol of the current section", "[005][error][order]") {
        auto err = detail::parse_error_of(
                "f: file format fmt\n"
                "Disassembly of section sec1:\n"
                "\topc1\n"sv);
        REQUIRE(err);
        CHECK(err->kind() == error_kind::missing_symbol);

        // a symbol of an earlier section does not count for the new one
        auto new_section = detail::parse_error_of(
                "f: file format fmt\n"
                "Disassembly of section sec1:\n"
                "<sym1>:\n"
                "\topc1\n"
                "Disassembly of section sec2:\n"
                "\topc2\n"sv);
        REQUIRE(new_section);
        CHECK(new_section->kind() == error_kind::missing_symbol);
        CHECK(new_section->line_number() == std::optional<size_t>{6U});
    }

    TEST_CASE("005: tree-level attach operations report ordering errors", "[005][error][order]") {
        disassembly disasm{"f", "fmt"};
        CHECK(disasm.current_section() == nullptr);

        auto symbol_err = detail::capture_error([&] { disasm.add_symbol(symbol{"<sym>"}); });
        REQUIRE(symbol_err);
        CHECK(symbol_err->kind() == error_kind::missing_section);

        auto ins_err = detail::capture_error([&] { disasm.add_instruction(instruction{"nop"}); });
        REQUIRE(ins_err);
        CHECK(ins_err->kind() == error_kind::missing_section);

        disasm.add_section(section{".text"});
        auto no_symbol_err = detail::capture_error([&] { disasm.add_instruction(instruction{"nop"}); });
        REQUIRE(no_symbol_err);
        CHECK(no_symbol_err->kind() == error_kind::missing_symbol);

        CHECK(disasm.symbol_count() == 0U);
        CHECK(disasm.instruction_count() == 0U);
    }
}  // namespace disnorm::test
