#include "disnorm/cli.hpp"

#include "disnorm/disassembly.hpp"
#include "disnorm/error.hpp"
#include "disnorm/format.hpp"
#include "disnorm/json.hpp"
#include "disnorm/objdump.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace disnorm::literals;

namespace disnorm::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    static constexpr auto stdin_marker = "-"sv;

    static std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw disasm_error::io_failure("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw disasm_error::io_failure("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    static std::string read_stdin() {
        std::ostringstream ss{};
        ss << std::cin.rdbuf();
        if (std::cin.bad()) {
            throw disasm_error::io_failure("failed to read standard input");
        }
        return ss.str();
    }

    static void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        if (!out) {
            throw disasm_error::io_failure("failed to open {}"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw disasm_error::io_failure("failed to write {}"_format(path.string()));
        }
    }

    template <typename T>
    static T read_json_file(const fs::path& path) {
        T value{};
        auto json = read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (ec) {
            throw disasm_error::io_failure("failed to parse json file {}"_format(path.string()));
        }
        return value;
    }

    static void validate_supported_schema_version(int schema_version, const fs::path& path) {
        if (schema_version > internal::supported_schema_version) {
            throw disasm_error::io_failure(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), schema_version, internal::supported_schema_version));
        }
    }

    // objdump may be a bare tool name resolved through PATH; anything that looks like a path has to exist
    static std::string validate_executable(const std::string& value) {
        if (value.find('/') == std::string::npos) {
            return {};
        }
        if (!fs::is_regular_file(value)) {
            return "File does not exist: " + value;
        }
        return {};
    }

    static std::string validate_input(const std::string& value) {
        if (value == stdin_marker || fs::is_regular_file(value)) {
            return {};
        }
        return "File does not exist: " + value;
    }

    static std::string acquire_text(const startup_config& cfg) {
        if (cfg.input_path) {
            if (cfg.input_path->native() == stdin_marker) {
                return read_stdin();
            }
            return read_text_file(*cfg.input_path);
        }
        if (!cfg.object_path) {
            throw disasm_error::io_failure("no object file or input text given");
        }

        objdump_request request{};
        request.objdump_path = cfg.objdump_path;
        request.object_path = *cfg.object_path;
        request.verbose = cfg.verbose;
        return load_disassembly_text(request);
    }

    static std::string render(const disassembly& disasm, const startup_config& cfg) {
        switch (cfg.output) {
            case output_mode::json:
                return to_json(disasm);
            case output_mode::text:
                break;
        }
        return disasm.to_string(cfg.render);
    }

    static void print_error(const disasm_error& e, std::ostream& err) {
        err << "error: ";
        if (auto line_number = e.line_number()) {
            err << "line " << *line_number << ": ";
        }
        err << e.what() << '\n';
    }

}}  // namespace disnorm::cli::detail

namespace disnorm::cli {

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "object=" << (cfg.object_path ? cfg.object_path->string() : "<none>") << '\n';
        os << "input=" << (cfg.input_path ? cfg.input_path->string() : "<none>") << '\n';
        os << "objdump=" << cfg.objdump_path.string() << '\n';
        os << "out=" << (cfg.out_path ? cfg.out_path->string() : "<stdout>") << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "include_operands=" << (cfg.render.include_operands ? "true" : "false") << '\n';
        os << "include_comments=" << (cfg.render.include_comments ? "true" : "false") << '\n';
    }

    void apply_config_file(const std::filesystem::path& path, startup_config& cfg) {
        auto data = detail::read_json_file<internal::persisted_config>(path);
        detail::validate_supported_schema_version(data.schema_version, path);

        if (data.objdump) {
            cfg.objdump_path = *data.objdump;
        }
        if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
            throw disasm_error::io_failure(
                    "invalid output in {}: {} (expected text|json)"_format(path.string(), *data.output));
        }
        if (data.include_operands) {
            cfg.render.include_operands = *data.include_operands;
        }
        if (data.include_comments) {
            cfg.render.include_comments = *data.include_comments;
        }
        cfg.config_path = path;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"disnorm: address-free, sorted objdump listings for diffing builds"};

        bool show_version = false;
        bool include_operands = false;
        bool include_comments = false;
        std::string object_arg{};
        std::string input_arg{};
        std::string objdump_arg{cfg.objdump_path.string()};
        std::string out_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string config_arg{};

        auto* object_opt = app.add_option("OBJ-FILE", object_arg, "Disassemble <OBJ-FILE>")->check(CLI::ExistingFile);
        auto* input_opt =
                app.add_option("-i,--input", input_arg, "Normalize saved objdump text from <FILE> ('-' for stdin)")
                        ->check(detail::validate_input);
        object_opt->excludes(input_opt);
        auto* objdump_opt = app.add_option("-e,--executable", objdump_arg, "Use the objdump executable <FILE>")
                                    ->check(detail::validate_executable);
        app.add_option("-o,--out", out_arg, "Place the output into <FILE>");
        auto* output_opt = app.add_option("--output", output_arg, "Output mode: text|json");
        auto* operands_opt = app.add_flag("--operands", include_operands, "Keep instruction operands in text output");
        auto* comments_opt = app.add_flag("--comments", include_comments, "Keep instruction comments in text output");
        app.add_option("--config", config_arg, "Load defaults from a JSON config <FILE>")->check(CLI::ExistingFile);
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");
        app.add_flag("--version", show_version, "Print version and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "disnorm 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            try {
                apply_config_file(config_arg, cfg);
            } catch (const disasm_error& e) {
                detail::print_error(e, std::cerr);
                return std::optional<int>{2};
            }
        }

        // explicit flags win over the config file
        if (objdump_opt->count() > 0U) {
            cfg.objdump_path = objdump_arg;
        }
        if (output_opt->count() > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (operands_opt->count() > 0U) {
            cfg.render.include_operands = include_operands;
        }
        if (comments_opt->count() > 0U) {
            cfg.render.include_comments = include_comments;
        }

        if (object_opt->count() > 0U) {
            cfg.object_path = object_arg;
        }
        if (input_opt->count() > 0U) {
            cfg.input_path = input_arg;
        }
        if (!out_arg.empty()) {
            cfg.out_path = out_arg;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (!cfg.object_path && !cfg.input_path) {
            std::cerr << "an OBJ-FILE or --input is required\n" << app.help();
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

    int run(const startup_config& cfg) {
        try {
            auto text = detail::acquire_text(cfg);
            auto disasm = disassembly::from_text(text);

            if (cfg.verbose) {
                std::cerr << "parsed {} sections, {} symbols, {} instructions from '{}' ({})\n"_format(
                        disasm.sections().size(),
                        disasm.symbol_count(),
                        disasm.instruction_count(),
                        disasm.file_name(),
                        disasm.file_format());
            }

            auto rendered = detail::render(disasm, cfg);
            if (cfg.out_path) {
                detail::write_text_file(*cfg.out_path, rendered);
            }
            else {
                std::cout << rendered << std::flush;
                if (!std::cout) {
                    throw disasm_error::io_failure("failed to write standard output");
                }
            }
        } catch (const disasm_error& e) {
            detail::print_error(e, std::cerr);
            return 1;
        }
        return 0;
    }

}  // namespace disnorm::cli
