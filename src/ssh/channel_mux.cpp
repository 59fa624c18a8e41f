#include "channel_mux.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ChannelMux::ChannelMux(Transport& transport, int max_channels, int eof_wait_ms)
    : transport_(transport), max_channels_(max_channels), eof_wait_ms_(eof_wait_ms) {}

ChannelMux::~ChannelMux() {
    invalidate_all("connection destroyed");
}

void ChannelMux::set_fault_handler(Channel::FaultHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_fault_ = std::move(handler);
}

Result<std::shared_ptr<Channel>> ChannelMux::open(ChannelType type, const ChannelParams& params) {
    using R = Result<std::shared_ptr<Channel>>;
    int id;
    Channel::FaultHandler fault;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int in_use = reserved_;
        for (const auto& [_, ch] : channels_) {
            if (ch->state() != ChannelState::Closed) in_use++;
        }
        if (in_use >= max_channels_) {
            return R::Err(ErrorKind::ChannelLimitExceeded, "open-channel", channel_type_name(type),
                          fmt::format("{} of {} channels in use", in_use, max_channels_));
        }
        reserved_++;
        id = next_id_++;
        fault = on_fault_;
    }

    std::shared_ptr<Channel> channel;
    Error err;
    if (type == ChannelType::Sftp) {
        auto r = transport_.open_sftp();
        if (r.is_ok()) channel = std::make_shared<Channel>(id, std::move(r.value));
        else err = r.error;
    } else {
        auto r = transport_.open_channel(type, params);
        if (r.is_ok()) channel = std::make_shared<Channel>(id, type, std::move(r.value));
        else err = r.error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reserved_--;
    if (!channel) {
        hostlink_log(fmt::format("[mux] open {} failed: {}", channel_type_name(type), err.describe()));
        return R::Err(err);
    }
    channel->set_fault_handler(fault);
    channel->mark_open();
    channels_[id] = channel;
    hostlink_log(fmt::format("[mux] opened {} channel {} ({} tracked)",
                             channel_type_name(type), id, channels_.size()));
    return R::Ok(channel);
}

void ChannelMux::release(const std::shared_ptr<Channel>& channel) {
    if (!channel) return;
    channel->shutdown(eof_wait_ms_);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel->id());
    if (it != channels_.end() && it->second == channel) channels_.erase(it);
}

void ChannelMux::close_all() {
    for (auto& ch : channels()) release(ch);
}

void ChannelMux::invalidate_all(const std::string& reason) {
    for (auto& ch : channels()) ch->invalidate(reason);
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.clear();
}

int ChannelMux::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = reserved_;
    for (const auto& [_, ch] : channels_) {
        if (ch->state() != ChannelState::Closed) n++;
    }
    return n;
}

std::vector<std::shared_ptr<Channel>> ChannelMux::channels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Channel>> out;
    out.reserve(channels_.size());
    for (const auto& [_, ch] : channels_) out.push_back(ch);
    return out;
}
