#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

// CancelRegistry: cancellation flags keyed by caller-visible id.
//
// acquire() registers an id and hands back a Registration; the entry is
// removed when the Registration is destroyed, on every exit path. cancel()
// only flips the flag. The running task notices it at its next poll.
class CancelRegistry {
public:
    class Registration {
    public:
        Registration() = default;
        ~Registration();

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        const std::string& id() const { return id_; }
        bool cancelled() const { return flag_ && flag_->load(); }
        const std::atomic<bool>* flag() const { return flag_.get(); }
        bool active() const { return registry_ != nullptr; }

    private:
        friend class CancelRegistry;
        Registration(CancelRegistry* registry, std::string id,
                     std::shared_ptr<std::atomic<bool>> flag);
        void reset();

        CancelRegistry* registry_ = nullptr;
        std::string id_;
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    // label names the ids in error messages ("command", "transfer").
    CancelRegistry(std::string label, ErrorKind duplicate_kind, ErrorKind missing_kind);

    Result<Registration> acquire(const std::string& id, const std::string& owner);
    Result<void> cancel(const std::string& id);

    // Flag every id owned by owner. Returns how many were flagged.
    int cancel_owned(const std::string& owner);

    bool contains(const std::string& id) const;
    std::optional<std::string> owner(const std::string& id) const;
    std::vector<std::string> ids_for(const std::string& owner) const;
    size_t size() const;

private:
    struct Entry {
        std::string owner;
        std::shared_ptr<std::atomic<bool>> flag;
    };

    void release(const std::string& id, const std::shared_ptr<std::atomic<bool>>& flag);

    const std::string label_;
    const ErrorKind duplicate_kind_;
    const ErrorKind missing_kind_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};
