#include "hostlink_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/config.hpp>
#include <readline/readline.h>
#include <readline/history.h>

HostlinkCLI::HostlinkCLI() : BaseCLI() {
    register_all_commands();
}

void HostlinkCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Close every session and exit");

    add_command("exit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Close every session and exit");

    add_command("clear-screen", [](BaseCLI&, const std::string&) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    add_command("setup", [this](BaseCLI&, const std::string&) {
        run_setup();
    }, "Write a default config file");

    register_session_commands(*this);
    register_command_commands(*this);
    register_host_commands(*this);
    register_file_commands(*this);
    register_transfer_commands(*this);
    register_forward_commands(*this);
}

void HostlinkCLI::run_repl(const std::string& profile) {
    std::cout << theme::banner();

    if (!config_exists()) {
        std::cout << theme::info("No config at " + get_config_path().string() + "; using defaults.");
        std::cout << theme::step("Run 'setup' to write one with example profiles.");
    } else {
        std::cout << theme::kv("Config", get_config_path().string());
        std::cout << theme::kv("Profiles", std::to_string(service.config().connections().size()));
    }

    if (!profile.empty()) {
        std::cout << theme::section("Connecting");
        execute_command("connect", profile);
    }
    std::cout << theme::divider();
    std::cout << theme::muted("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::muted("    Disconnecting...") << "\n";
    service.shutdown();
}

void HostlinkCLI::run_setup() {
    auto created = create_default_config();
    if (created.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + created.error.describe());
        return;
    }
    std::cout << theme::ok("Config file ready at " + get_config_path().string());
    std::cout << theme::step("Add your hosts under 'connections', then run 'hostlink connect <name>'.");
}
