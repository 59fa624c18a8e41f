#include "session_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <transfer/integrity.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

SessionRegistry::SessionRegistry(const ClientSettings& settings, TransportFactory& factory,
                                 EventListener& events)
    : settings_(settings),
      factory_(factory),
      events_(events),
      commands_("command", ErrorKind::DuplicateCommandId, ErrorKind::CommandNotFound) {}

SessionRegistry::~SessionRegistry() {
    disconnect_all();
}

Result<std::string> SessionRegistry::connect(const ConnectionConfig& config,
                                             const std::string& existing_id) {
    using R = Result<std::string>;

    if (!existing_id.empty()) {
        auto actor = get(existing_id);
        if (actor.is_err()) return R::Err(actor.error);
        if (config.identity() != actor.value->config().identity()) {
            hostlink_log(fmt::format("[registry] {} keeps its config {}; ignoring {}", existing_id,
                                     actor.value->config().identity(), config.identity()));
        }
        auto r = actor.value->connect().get();
        if (r.is_err()) return R::Err(r.error);
        return R::Ok(existing_id);
    }

    if (config.host.empty() || config.username.empty()) {
        return R::Err(ErrorKind::InvalidArgument, "connect", config.name, "host and username are required");
    }

    std::string id = generate_id("sess");
    auto actor = std::make_shared<SessionActor>(id, config, settings_, factory_, commands_, events_);
    actor->start();

    auto r = actor->connect().get();
    if (r.is_err()) {
        actor->stop();
        hostlink_log(fmt::format("[registry] connect {} failed: {}", config.identity(), r.error.describe()));
        return R::Err(r.error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[id] = actor;
        order_.push_back(id);
    }
    hostlink_log(fmt::format("[registry] session {} -> {}", id, config.identity()));
    return R::Ok(id);
}

Result<void> SessionRegistry::disconnect(const std::string& session_id) {
    std::shared_ptr<SessionActor> actor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<void>::Err(ErrorKind::SessionNotFound, "disconnect", session_id, "no such session");
        }
        actor = it->second;
        sessions_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), session_id), order_.end());
    }
    actor->stop();
    hostlink_log(fmt::format("[registry] session {} closed", session_id));
    return Result<void>::Ok();
}

void SessionRegistry::disconnect_all() {
    std::vector<std::shared_ptr<SessionActor>> actors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) actors.push_back(sessions_[id]);
        sessions_.clear();
        order_.clear();
    }
    for (auto& a : actors) a->stop();
}

Result<std::shared_ptr<SessionActor>> SessionRegistry::get(const std::string& session_id) const {
    using R = Result<std::shared_ptr<SessionActor>>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return R::Err(ErrorKind::SessionNotFound, "lookup", session_id, "no such session");
    return R::Ok(it->second);
}

std::vector<SessionSummary> SessionRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> out;
    for (const auto& id : order_) {
        const auto& actor = sessions_.at(id);
        SessionSummary s;
        s.id = id;
        s.name = actor->config().name;
        s.identity = actor->config().identity();
        s.status = actor->status();
        out.push_back(std::move(s));
    }
    return out;
}

// ── TransferBackend ────────────────────────────────────────────

bool SessionRegistry::has_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

Result<std::shared_ptr<Channel>> SessionRegistry::open_sftp(const std::string& session_id) {
    auto actor = get(session_id);
    if (actor.is_err()) return Result<std::shared_ptr<Channel>>::Err(actor.error);
    return actor.value->open_channel(ChannelType::Sftp).get();
}

void SessionRegistry::release_channel(const std::string& session_id, std::shared_ptr<Channel> channel) {
    auto actor = get(session_id);
    if (actor.is_ok()) {
        actor.value->release_channel(std::move(channel));
    } else if (channel) {
        channel->invalidate("session closed");
    }
}

Result<std::string> SessionRegistry::remote_sha256(const std::string& session_id, const std::string& path) {
    using R = Result<std::string>;
    auto actor = get(session_id);
    if (actor.is_err()) return R::Err(actor.error);

    std::string command_id = generate_id("hash");
    auto pending = actor.value->exec("sha256sum " + shell_quote(path), command_id);
    if (pending.wait_for(std::chrono::seconds(REMOTE_HASH_TIMEOUT_SECS)) != std::future_status::ready) {
        auto cancelled = actor.value->cancel_exec(command_id).get();
        if (cancelled.is_err()) {
            hostlink_log(fmt::format("[registry] cancel {}: {}", command_id, cancelled.error.describe()));
        }
        pending.wait();
        return R::Err(ErrorKind::Timeout, "sha256", path,
                      fmt::format("no answer within {}s", REMOTE_HASH_TIMEOUT_SECS));
    }

    auto out = pending.get();
    hostlink_log_exec("[sha256]", "sha256sum " + path, out);
    if (out.is_err()) return R::Err(out.error);
    if (out.value.exit_status != 0) {
        return R::Err(ErrorKind::ChannelProtocolError, "sha256", path,
                      fmt::format("sha256sum exited {}: {}", out.value.exit_status, out.value.stderr_data));
    }
    auto digest = parse_sha256_output(out.value.stdout_data);
    if (!digest) {
        return R::Err(ErrorKind::ChannelProtocolError, "sha256", path, "unexpected sha256sum output");
    }
    return R::Ok(*digest);
}
