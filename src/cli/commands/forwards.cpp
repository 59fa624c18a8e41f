#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void do_forward(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    if (args.size() != 3) {
        std::cout << "Usage: forward <local-port> <remote-host> <remote-port>\n";
        return;
    }
    int lport = safe_stoi(args[0], -1);
    int rport = safe_stoi(args[2], -1);
    if (lport < 0 || rport <= 0) {
        std::cout << theme::fail("Ports must be numbers");
        return;
    }
    auto r = cli.service.start_forward(cli.current_session, lport, args[1], rport);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    std::cout << theme::ok(fmt::format("{}: localhost:{} -> {}:{}", r.value.id, r.value.local_port,
                                       r.value.target_host, r.value.target_port));
}

static void do_forwards(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    auto r = cli.service.list_forwards(cli.current_session);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    std::cout << theme::section("Forwards");
    if (r.value.empty()) std::cout << theme::muted("    none") << "\n";
    for (const auto& f : r.value) {
        std::cout << fmt::format("    {:<24} localhost:{:<6} -> {}:{} ({} open)\n", f.id, f.local_port,
                                 f.target_host, f.target_port, f.active_connections);
    }
    std::cout << "\n";
}

static void do_unforward(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << "Usage: unforward <forward-id>\n";
        return;
    }
    auto r = cli.service.stop_forward(arg);
    if (r.is_err()) print_error(r.error);
    else std::cout << theme::ok("Stopped " + arg);
}

void register_forward_commands(BaseCLI& cli) {
    cli.add_command("forward", do_forward, "Forward a local port through the session");
    cli.add_command("forwards", do_forwards, "List port forwards");
    cli.add_command("unforward", do_unforward, "Stop a port forward");
}
