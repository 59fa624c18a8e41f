#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>

// ── Events ────────────────────────────────────────────────────

void CliEvents::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cout << text << std::flush;
}

void CliEvents::session_status_changed(const std::string& session_id, SessionStatus status) {
    print(theme::event(session_id, session_status_name(status)));
}

void CliEvents::command_output(const std::string&, const std::string& chunk) {
    print(chunk);
}

void CliEvents::transfer_progress(const std::string& transfer_id, std::uint64_t transferred,
                                  std::uint64_t total) {
    if (!show_progress_) return;
    int pct = total > 0 ? static_cast<int>(transferred * 100 / total) : 100;
    print(theme::event(transfer_id, fmt::format("{}/{} bytes ({}%)", transferred, total, pct)));
}

void CliEvents::transfer_status_changed(const std::string& transfer_id, TransferStatus status,
                                        const std::optional<Error>& error) {
    std::string msg = transfer_status_name(status);
    if (error) msg += ": " + error->describe();
    print(theme::event(transfer_id, msg));
}

void CliEvents::reconnect_attempt_failed(const std::string& session_id, int attempt, const Error& error) {
    print(theme::event(session_id, fmt::format("reconnect attempt {} failed: {}", attempt, error.message)));
}

void CliEvents::reconnect_exhausted(const std::string& session_id) {
    print(theme::event(session_id, "giving up on reconnect; run 'reconnect' to try again"));
}

void CliEvents::shell_output(const std::string&, const std::string& data) {
    print(data);
}

void CliEvents::shell_closed(const std::string& session_id) {
    print(theme::event(session_id, "shell closed"));
}

// ── BaseCLI ───────────────────────────────────────────────────

BaseCLI::BaseCLI() : service(events) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_session() {
    if (current_session.empty()) {
        std::cout << theme::fail("No session selected.");
        std::cout << theme::step("Run 'connect <profile>' or 'use <session-id>'.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sessions",  {"connect", "reconnect", "sessions", "use", "status", "disconnect"}},
        {"Commands",  {"exec", "spawn", "cancel", "shell", "send", "unshell"}},
        {"Host",      {"sysinfo", "search", "pwd"}},
        {"Files",     {"ls", "stat", "cat", "mkdir", "touch", "rm", "mv", "chmod"}},
        {"Transfers", {"put", "get", "transfers", "pause", "resume", "abort", "forget",
                       "pause-all", "resume-all", "abort-all", "forget-all", "clear", "progress"}},
        {"Forwards",  {"forward", "forwards", "unforward"}},
        {"General",   {"setup", "help", "clear-screen", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::paint(theme::Tone::Heading, "  " + cat_name) << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) std::cout << theme::command_row(name, it->second.second);
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (current_session.empty()) {
        return rl_esc(theme::escape(theme::Tone::Heading)) + "hostlink"
             + rl_esc(theme::reset()) + "> ";
    }

    std::string label = current_session;
    SessionStatus status = SessionStatus::Disconnected;
    for (const auto& s : service.list_sessions()) {
        if (s.id == current_session) {
            label = s.name.empty() ? s.identity : s.name;
            status = s.status;
        }
    }
    theme::Tone tint = status == SessionStatus::Connected ? theme::Tone::Good
                     : status == SessionStatus::Connecting ? theme::Tone::Warn
                     : theme::Tone::Bad;
    return rl_esc(theme::escape(theme::Tone::Heading)) + "hostlink"
         + rl_esc(theme::reset()) + ":"
         + rl_esc(theme::escape(tint)) + label
         + rl_esc(theme::reset()) + "> ";
}

std::vector<std::string> split_args(const std::string& args) {
    std::istringstream iss(args);
    std::vector<std::string> out;
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

void print_error(const Error& error) {
    std::cout << theme::fail(error.describe());
}
