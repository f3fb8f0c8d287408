#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace disnorm {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        inline constexpr std::string_view whitespace_chars{" \t\r\n\v\f"};

        constexpr bool is_space(char c) noexcept {
            return whitespace_chars.find(c) != std::string_view::npos;
        }

        constexpr bool is_lower(char c) noexcept { return c >= 'a' && c <= 'z'; }

        constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        constexpr bool is_alnum(char c) noexcept {
            return is_lower(c) || is_digit(c) || (c >= 'A' && c <= 'Z');
        }

        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(whitespace_chars);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(whitespace_chars);
            return value.substr(first, (last - first) + 1U);
        }

        constexpr bool is_blank(std::string_view value) { return trim_view(value).empty(); }

        // Splits on '\n' and drops a trailing '\r' from each line. A final newline does not produce an empty line.
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t begin = 0U;
            while (begin < text.size()) {
                auto end = text.find('\n', begin);
                if (end == std::string_view::npos) {
                    end = text.size();
                }

                auto line = text.substr(begin, end - begin);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1U);
                }
                lines.push_back(line);
                begin = end + 1U;
            }
            return lines;
        }

        // Prepends `prefix` to every non-empty line of `text`; empty lines are kept as-is.
        inline std::string indent_lines(std::string_view text, std::string_view prefix = "    ") {
            std::string indented{};
            indented.reserve(text.size() + prefix.size() * 8U);

            size_t begin = 0U;
            while (begin < text.size()) {
                auto end = text.find('\n', begin);
                auto has_newline = end != std::string_view::npos;
                if (!has_newline) {
                    end = text.size();
                }

                auto line = text.substr(begin, end - begin);
                if (!line.empty()) {
                    indented.append(prefix);
                    indented.append(line);
                }
                if (has_newline) {
                    indented.push_back('\n');
                }
                begin = end + 1U;
            }
            return indented;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace disnorm
