#include "command_executor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

CommandExecutor::CommandExecutor(CancelRegistry& registry, const ExecSettings& settings,
                                 int eof_wait_ms)
    : registry_(registry), settings_(settings), eof_wait_ms_(eof_wait_ms) {}

Result<CancelRegistry::Registration> CommandExecutor::admit(const std::string& command_id,
                                                            const std::string& session_id) {
    return registry_.acquire(command_id, session_id);
}

Result<void> CommandExecutor::cancel(const std::string& command_id) {
    auto r = registry_.cancel(command_id);
    if (r.is_ok()) hostlink_log(fmt::format("[exec {}] cancel requested", command_id));
    return r;
}

Result<ExecOutput> CommandExecutor::execute(Channel& channel, const std::string& command,
                                            const CancelRegistry::Registration& registration,
                                            OutputSink sink) {
    using R = Result<ExecOutput>;
    const std::string& id = registration.id();
    ExecOutput out;
    char buf[SSH_READ_BUF_SIZE];

    bool has_deadline = settings_.timeout_secs > 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(settings_.timeout_secs);

    auto drain_stderr = [&]() -> IoResult {
        for (;;) {
            auto e = channel.read_stderr(buf, sizeof(buf));
            if (e.status != IoStatus::Ok) return e;
            out.stderr_data.append(buf, e.bytes);
        }
    };

    for (;;) {
        if (registration.cancelled()) {
            channel.shutdown(0);
            auto r = R::Err(ErrorKind::Cancelled, "exec", id, "cancelled by request");
            hostlink_log_exec("[exec " + id + "]", command, r);
            return r;
        }
        if (channel.invalidated()) {
            auto r = R::Err(ErrorKind::SessionLost, "exec", id, channel.invalidation_reason());
            hostlink_log_exec("[exec " + id + "]", command, r);
            return r;
        }

        auto rd = channel.read(buf, sizeof(buf));
        if (rd.status == IoStatus::Ok) {
            std::string chunk(buf, rd.bytes);
            out.stdout_data += chunk;
            if (sink) sink(chunk);
            continue;
        }
        if (rd.status == IoStatus::Error) {
            if (rd.fatal || channel.invalidated()) {
                std::string reason = channel.invalidated() ? channel.invalidation_reason() : rd.error;
                return R::Err(ErrorKind::SessionLost, "exec", id, reason);
            }
            channel.shutdown(0);
            return R::Err(ErrorKind::ChannelProtocolError, "exec", id, rd.error);
        }

        auto er = drain_stderr();
        if (er.status == IoStatus::Error && er.fatal) {
            return R::Err(ErrorKind::SessionLost, "exec", id, er.error);
        }

        if (rd.status == IoStatus::Eof) break;

        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            channel.shutdown(0);
            return R::Err(ErrorKind::Timeout, "exec", id,
                          fmt::format("no exit after {}s", settings_.timeout_secs));
        }
        platform::sleep_ms(settings_.poll_interval_ms);
    }

    drain_stderr();
    channel.shutdown(eof_wait_ms_);
    out.exit_status = channel.exit_status();

    auto r = R::Ok(std::move(out));
    hostlink_log_exec("[exec " + id + "]", command, r);
    return r;
}
