#pragma once

#include <functional>
#include <string>
#include <core/cancel_registry.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/channel.hpp>

// CommandExecutor: runs one command on a dedicated Exec channel.
//
// admit() registers the command id (DuplicateCommandId when it is already
// in flight); execute() streams output until remote EOF, cancellation,
// timeout or connection loss, then closes the channel. Cancellation is
// polled every exec.poll_interval_ms.
class CommandExecutor {
public:
    using OutputSink = std::function<void(const std::string& chunk)>;

    CommandExecutor(CancelRegistry& registry, const ExecSettings& settings, int eof_wait_ms);

    Result<CancelRegistry::Registration> admit(const std::string& command_id,
                                               const std::string& session_id);

    Result<ExecOutput> execute(Channel& channel, const std::string& command,
                               const CancelRegistry::Registration& registration,
                               OutputSink sink = nullptr);

    Result<void> cancel(const std::string& command_id);

private:
    CancelRegistry& registry_;
    ExecSettings settings_;
    int eof_wait_ms_;
};
