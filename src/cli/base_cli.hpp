#pragma once

#include <atomic>
#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <functional>
#include <session/events.hpp>
#include <session/hostlink_service.hpp>

// Prints service events as they arrive, from whichever thread raises them.
class CliEvents : public EventListener {
public:
    void session_status_changed(const std::string& session_id, SessionStatus status) override;
    void command_output(const std::string& command_id, const std::string& chunk) override;
    void transfer_progress(const std::string& transfer_id, std::uint64_t transferred,
                           std::uint64_t total) override;
    void transfer_status_changed(const std::string& transfer_id, TransferStatus status,
                                 const std::optional<Error>& error) override;
    void reconnect_attempt_failed(const std::string& session_id, int attempt,
                                  const Error& error) override;
    void reconnect_exhausted(const std::string& session_id) override;
    void shell_output(const std::string& session_id, const std::string& data) override;
    void shell_closed(const std::string& session_id) override;

    // Progress lines are noisy; off unless asked for.
    void set_show_progress(bool on) { show_progress_ = on; }

private:
    void print(const std::string& text);

    std::mutex out_mutex_;
    std::atomic<bool> show_progress_{false};
};

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Prints why and returns false when no session is selected.
    bool require_session();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    // Public state
    CliEvents events;
    HostlinkService service;
    std::string current_session;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Split "a b c" on whitespace
std::vector<std::string> split_args(const std::string& args);

// Print an error the way every command does
void print_error(const Error& error);
