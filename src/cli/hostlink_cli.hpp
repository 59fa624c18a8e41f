#pragma once

#include "base_cli.hpp"
#include <string>

// Command registration, one file per area under commands/
void register_session_commands(BaseCLI& cli);
void register_command_commands(BaseCLI& cli);
void register_host_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_transfer_commands(BaseCLI& cli);
void register_forward_commands(BaseCLI& cli);

class HostlinkCLI : public BaseCLI {
public:
    HostlinkCLI();

    // Interactive loop; returns on quit or end of input.
    void run_repl(const std::string& profile = "");
    void run_setup();

private:
    void register_all_commands();
    bool quit_ = false;
};
