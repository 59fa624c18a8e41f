#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <future>
#include <memory>
#include <thread>
#include <fmt/format.h>
#include <core/utils.hpp>

// Output streams through CliEvents; only stderr and the exit code are printed here.
static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }
    auto result = cli.service.exec(cli.current_session, arg);
    if (result.is_err()) {
        print_error(result.error);
        return;
    }
    if (!result.value.stderr_data.empty()) {
        std::cerr << result.value.stderr_data;
    }
    if (result.value.exit_status != 0) {
        std::cout << theme::muted(fmt::format("    exit {}", result.value.exit_status)) << "\n";
    }
}

// Run in the background; the caller can cancel it by id.
static void do_spawn(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    if (arg.empty()) {
        std::cout << "Usage: spawn <command>\n";
        return;
    }
    std::string id = generate_id("cmd");
    auto pending = std::make_shared<std::future<Result<ExecOutput>>>(
        cli.service.exec_async(cli.current_session, arg, id));
    std::cout << theme::info("Started " + id);

    // Detached reporter: prints the outcome once the command settles
    std::thread([pending, id] {
        auto r = pending->get();
        if (r.is_err()) std::cout << theme::event(id, r.error.describe()) << std::flush;
        else std::cout << theme::event(id, fmt::format("exit {}", r.value.exit_status)) << std::flush;
    }).detach();
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << "Usage: cancel <command-id>\n";
        return;
    }
    auto r = cli.service.cancel_exec(arg);
    if (r.is_err()) print_error(r.error);
    else std::cout << theme::ok("Cancelling " + arg);
}

static void do_shell(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    auto r = cli.service.open_shell(cli.current_session, 120, 40);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    std::cout << theme::ok("Shell open; use 'send <text>' and 'unshell'.");
}

static void do_send(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto r = cli.service.write(cli.current_session, arg + "\n");
    if (r.is_err()) print_error(r.error);
}

static void do_unshell(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    auto r = cli.service.close_shell(cli.current_session);
    if (r.is_err()) print_error(r.error);
}

void register_command_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command and wait for it");
    cli.add_command("spawn", do_spawn, "Run a command in the background");
    cli.add_command("cancel", do_cancel, "Cancel a running command by id");
    cli.add_command("shell", do_shell, "Open an interactive shell channel");
    cli.add_command("send", do_send, "Send a line to the shell");
    cli.add_command("unshell", do_unshell, "Close the shell channel");
}
