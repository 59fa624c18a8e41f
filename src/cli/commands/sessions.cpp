#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: connect <profile>");
        const auto& profiles = cli.service.config().connections();
        if (!profiles.empty()) {
            std::string names;
            for (const auto& p : profiles) names += (names.empty() ? "" : ", ") + p.name;
            std::cout << theme::step("Profiles: " + names);
        }
        return;
    }

    std::cout << theme::step("Connecting to " + arg + "...");
    auto r = cli.service.connect_profile(arg);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    cli.current_session = r.value;
    std::cout << theme::ok("Session " + r.value);
}

static void do_reconnect(BaseCLI& cli, const std::string& arg) {
    std::string id = arg.empty() ? cli.current_session : arg;
    if (id.empty()) {
        std::cout << theme::fail("Usage: reconnect [session-id]");
        return;
    }
    for (const auto& s : cli.service.list_sessions()) {
        if (s.id != id) continue;
        ConnectionConfig cfg;
        cfg.name = s.name;
        auto r = cli.service.connect(cfg, id);
        if (r.is_err()) print_error(r.error);
        else std::cout << theme::ok("Reconnected " + id);
        return;
    }
    std::cout << theme::fail("No such session: " + id);
}

static void do_sessions(BaseCLI& cli, const std::string&) {
    auto sessions = cli.service.list_sessions();
    std::cout << theme::section("Sessions");
    if (sessions.empty()) {
        std::cout << theme::muted("    none") << "\n\n";
        return;
    }
    for (const auto& s : sessions) {
        std::string marker = s.id == cli.current_session ? "*" : " ";
        std::cout << fmt::format("  {} {:<24} {:<16} {:<28} {}\n", marker, s.id, s.name, s.identity,
                                 session_status_name(s.status));
    }
    std::cout << "\n";
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    for (const auto& s : cli.service.list_sessions()) {
        if (s.id == arg || s.name == arg) {
            cli.current_session = s.id;
            std::cout << theme::ok("Using " + s.id);
            return;
        }
    }
    std::cout << theme::fail("No such session: " + arg);
}

static void do_status(BaseCLI& cli, const std::string&) {
    std::cout << theme::section("Status");
    std::cout << theme::kv("Config", config_exists() ? get_config_path().string() : "defaults");
    std::cout << theme::kv("Sessions", std::to_string(cli.service.list_sessions().size()));
    std::cout << theme::kv("Current", cli.current_session.empty() ? "-" : cli.current_session);

    int running = 0;
    for (const auto& t : cli.service.list_transfers()) {
        if (t.item.parent_id.empty() && t.item.status == TransferStatus::Running) running++;
    }
    std::cout << theme::kv("Transfers", fmt::format("{} running", running));
    std::cout << "\n";
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    std::string id = arg.empty() ? cli.current_session : arg;
    if (id.empty()) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    auto r = cli.service.disconnect(id);
    if (r.is_err()) {
        print_error(r.error);
        return;
    }
    if (id == cli.current_session) cli.current_session.clear();
    std::cout << theme::ok("Disconnected " + id);
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Open a session to a configured profile");
    cli.add_command("reconnect", do_reconnect, "Reconnect a lost session, keeping its id");
    cli.add_command("sessions", do_sessions, "List sessions");
    cli.add_command("use", do_use, "Select the current session");
    cli.add_command("status", do_status, "Show config, session and transfer status");
    cli.add_command("disconnect", do_disconnect, "Close a session");
}
