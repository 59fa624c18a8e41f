#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static std::string format_mode(std::uint32_t mode, bool is_dir) {
    std::string s = is_dir ? "d" : "-";
    const char* bits = "rwxrwxrwx";
    for (int i = 0; i < 9; i++) s += (mode & (0400u >> i)) ? bits[i] : '-';
    return s;
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    std::string path = arg.empty() ? "." : arg;
    auto r = cli.service.list_dir(cli.current_session, path);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    for (const auto& e : r.value) {
        std::string name = e.is_dir ? theme::accent(e.name + "/") : e.name;
        std::cout << fmt::format("    {} {:>12} {}\n", format_mode(e.permissions, e.is_dir), e.size, name);
    }
}

static void do_stat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session() || arg.empty()) return;
    auto r = cli.service.stat(cli.current_session, arg);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    std::cout << theme::kv("Path", r.value.path);
    std::cout << theme::kv("Type", r.value.is_dir ? "directory" : "file");
    std::cout << theme::kv("Size", std::to_string(r.value.size));
    std::cout << theme::kv("Mode", format_mode(r.value.permissions, r.value.is_dir));
}

static void do_cat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    if (arg.empty()) {
        std::cout << "Usage: cat <path>\n";
        return;
    }
    auto r = cli.service.read_file(cli.current_session, arg);
    if (r.is_err()) print_error(r.error);
    else std::cout << r.value << (r.value.empty() || r.value.back() == '\n' ? "" : "\n");
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session() || arg.empty()) return;
    auto r = cli.service.mkdir(cli.current_session, arg);
    if (r.is_err()) print_error(r.error);
}

static void do_touch(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session() || arg.empty()) return;
    auto r = cli.service.create_file(cli.current_session, arg);
    if (r.is_err()) print_error(r.error);
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    bool recursive = !args.empty() && args[0] == "-r";
    if (recursive) args.erase(args.begin());
    if (args.size() != 1) {
        std::cout << "Usage: rm [-r] <path>\n";
        return;
    }
    auto r = cli.service.remove(cli.current_session, args[0], recursive);
    if (r.is_err()) print_error(r.error);
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: mv <from> <to>\n";
        return;
    }
    auto r = cli.service.rename(cli.current_session, args[0], args[1]);
    if (r.is_err()) print_error(r.error);
}

static void do_chmod(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: chmod <octal-mode> <path>\n";
        return;
    }
    std::uint32_t mode = 0;
    try {
        mode = static_cast<std::uint32_t>(std::stoul(args[0], nullptr, 8));
    } catch (const std::exception&) {
        std::cout << theme::fail("Mode must be octal, e.g. 644");
        return;
    }
    auto r = cli.service.chmod(cli.current_session, args[1], mode);
    if (r.is_err()) print_error(r.error);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a remote directory");
    cli.add_command("stat", do_stat, "Show remote file details");
    cli.add_command("cat", do_cat, "Print a small remote file");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory");
    cli.add_command("touch", do_touch, "Create an empty remote file");
    cli.add_command("rm", do_rm, "Remove a remote file (-r for directories)");
    cli.add_command("mv", do_mv, "Rename a remote path");
    cli.add_command("chmod", do_chmod, "Change remote permissions");
}
