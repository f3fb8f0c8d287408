#include "disnorm/objdump.hpp"

#include "disnorm/error.hpp"
#include "disnorm/format.hpp"
#include "disnorm/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace disnorm::literals;

namespace disnorm::detail {

    using namespace std::string_view_literals;

    namespace arg_tokens {
        static constexpr auto disassemble = "-d"sv;
        static constexpr auto no_addresses = "--no-addresses"sv;
        static constexpr auto no_show_raw_insn = "--no-show-raw-insn"sv;
    }  // namespace arg_tokens

    // exit status execvp failures are reported with, same as a shell
    static constexpr int tool_not_found_exit = 127;

    // Private capture directory for one objdump run, removed on scope exit
    struct scratch_dir {
        fs::path path{};

        scratch_dir() {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << "disnorm_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();

            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                throw disasm_error::io_failure("failed to create directory: {}"_format(path.string()));
            }
        }

        scratch_dir(const scratch_dir&) = delete;
        scratch_dir& operator=(const scratch_dir&) = delete;

        ~scratch_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    static std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            return {};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    static int open_write_file(const fs::path& path) {
        auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
        if (fd < 0) {
            throw disasm_error::io_failure("failed to open file for write: {}"_format(path.string()));
        }
        return fd;
    }

    static int run_process(
            const std::vector<std::string>& args, const fs::path& stdout_path, const fs::path& stderr_path) {
        auto stdout_fd = open_write_file(stdout_path);
        int stderr_fd = -1;
        try {
            stderr_fd = open_write_file(stderr_path);
        } catch (const disasm_error&) {
            ::close(stdout_fd);
            throw;
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_fd);
            ::close(stderr_fd);
            throw disasm_error::io_failure("fork failed");
        }

        if (pid == 0) {
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                _exit(tool_not_found_exit);
            }
            if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(tool_not_found_exit);
            }

            ::close(stdout_fd);
            ::close(stderr_fd);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(tool_not_found_exit);
        }

        ::close(stdout_fd);
        ::close(stderr_fd);

        int status = 0;
        if (::waitpid(pid, &status, 0) < 0) {
            throw disasm_error::io_failure("waitpid failed");
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

}  // namespace disnorm::detail

namespace disnorm {

    std::vector<std::string> build_objdump_command(const objdump_request& request) {
        std::vector<std::string> args{};
        args.emplace_back(request.objdump_path.string());
        args.emplace_back(detail::arg_tokens::disassemble);
        args.emplace_back(detail::arg_tokens::no_addresses);
        args.emplace_back(detail::arg_tokens::no_show_raw_insn);
        args.emplace_back(request.object_path.string());
        return args;
    }

    objdump_result run_objdump(const objdump_request& request) {
        objdump_result result{};
        result.command = build_objdump_command(request);

        if (request.verbose) {
            std::cerr << "running: " << utils::join_with_separator(result.command, " "sv) << '\n';
        }

        detail::scratch_dir scratch{};
        auto stdout_path = scratch.path / "objdump.stdout.txt";
        auto stderr_path = scratch.path / "objdump.stderr.txt";

        result.exit_code = detail::run_process(result.command, stdout_path, stderr_path);
        result.stdout_text = detail::read_text_file(stdout_path);
        result.stderr_text = detail::read_text_file(stderr_path);

        debug_log("objdump exited with ", result.exit_code, ", ", result.stdout_text.size(), " bytes on stdout");
        return result;
    }

    std::string load_disassembly_text(const objdump_request& request) {
        auto result = run_objdump(request);

        auto tool_missing =
                result.exit_code == detail::tool_not_found_exit && result.stdout_text.empty() &&
                result.stderr_text.empty();
        if (tool_missing) {
            throw disasm_error::io_failure(
                    "'{}' was not found! Check your PATH or explicitly provide an executable"_format(
                            request.objdump_path.string()));
        }
        if (!result.stderr_text.empty()) {
            throw disasm_error::io_failure(result.stderr_text);
        }
        if (result.exit_code != 0) {
            throw disasm_error::io_failure(
                    "'{}' exited with status {}"_format(request.objdump_path.string(), result.exit_code));
        }
        return std::move(result.stdout_text);
    }

}  // namespace disnorm
