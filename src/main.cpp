#include <iostream>
#include <vector>
#include <string>
#include "cli/hostlink_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::command_row("hostlink", "Enter the REPL", 29);
    std::cout << theme::command_row("hostlink connect <profile>", "Connect a saved profile and enter the REPL", 29);
    std::cout << theme::command_row("hostlink setup", "Write a default config file", 29);
    std::cout << "\n";
    std::cout << theme::muted("    hostlink --version           Show version\n"
                              "    hostlink --help              Show this help") << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string cmd = argc >= 2 ? argv[1] : "";

        if (cmd == "--version") {
            std::cout << theme::paint(theme::Tone::Strong, theme::accent("hostlink"))
                      << theme::muted(" version 0.1.0") << "\n";
            return 0;
        }
        if (cmd == "--help") {
            print_usage();
            return 0;
        }

        HostlinkCLI cli;

        if (cmd.empty()) {
            cli.run_repl();
        } else if (cmd == "connect") {
            if (argc < 3) {
                std::cout << theme::fail("Missing profile name.");
                std::cout << theme::step("Usage: hostlink connect <profile>");
                return 1;
            }
            cli.run_repl(argv[2]);
        } else if (cmd == "setup") {
            cli.run_setup();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
