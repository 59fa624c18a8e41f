#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <cstdlib>
#include <fmt/format.h>

static void print_processes(const std::string& title, const std::vector<ProcessInfo>& procs) {
    if (procs.empty()) return;
    std::cout << theme::section(title);
    std::cout << theme::muted(fmt::format("    {:>7}  {:>6}  {:>6}  {:>9}  {}", "PID", "CPU", "MEM", "RSS", "COMMAND"))
              << "\n";
    for (const auto& p : procs) {
        std::cout << fmt::format("    {:>7}  {:>6}  {:>6}  {:>9}  {}\n",
                                 p.pid, p.cpu_percent, p.mem_percent, p.rss, p.command);
    }
}

static void do_sysinfo(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    std::cout << theme::step("Querying host...");
    auto r = cli.service.system_status(cli.current_session);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    const auto& s = r.value;

    std::cout << theme::section("System");
    std::cout << theme::kv("Uptime", s.uptime);
    std::cout << theme::kv("Address", s.ip);
    std::cout << theme::kv("CPU", theme::meter(s.cpu_usage));
    if (s.memory) {
        double used = std::strtod(s.memory->usage.c_str(), nullptr);
        std::cout << theme::kv("Memory", theme::meter(used) + theme::muted(
            fmt::format("  {} of {}, {} free", s.memory->used, s.memory->total, s.memory->available)));
    }
    if (s.root_disk) {
        double used = std::strtod(s.root_disk->percent.c_str(), nullptr);
        std::cout << theme::kv("Disk " + s.root_disk->mount, theme::meter(used) + theme::muted(
            fmt::format("  {} of {}", s.root_disk->used, s.root_disk->size)));
    }

    if (s.mounts.size() > 1) {
        std::cout << theme::section("Mounts");
        for (const auto& d : s.mounts) {
            std::cout << fmt::format("    {:<24} {:>6} {:>6} {:>5}  {}\n",
                                     d.mount, d.size, d.used, d.percent, theme::muted(d.filesystem));
        }
    }
    print_processes("Top CPU", s.top_cpu);
    print_processes("Top memory", s.top_memory);
    std::cout << "\n";
}

// search <root> <pattern...>
static void do_search(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto space = arg.find(' ');
    if (space == std::string::npos) {
        std::cout << theme::fail("Usage: search <dir> <pattern>");
        return;
    }
    std::string root = arg.substr(0, space);
    std::string pattern = arg.substr(arg.find_first_not_of(' ', space));

    auto r = cli.service.search(cli.current_session, root, pattern);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    if (r.value.empty()) {
        std::cout << theme::info("No matches");
        return;
    }
    for (const auto& m : r.value) {
        std::cout << "    " << theme::accent(m.path) << theme::muted(fmt::format(":{}:", m.line))
                  << " " << m.text << "\n";
    }
    std::cout << theme::muted(fmt::format("    {} match(es)", r.value.size())) << "\n";
}

static void do_pwd(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    auto r = cli.service.working_directory(cli.current_session);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    std::cout << "    " << r.value << "\n";
}

void register_host_commands(BaseCLI& cli) {
    cli.add_command("sysinfo", do_sysinfo, "Uptime, CPU, memory, disks and top processes");
    cli.add_command("search", do_search, "Search file contents below a directory");
    cli.add_command("pwd", do_pwd, "Print the login directory");
}
