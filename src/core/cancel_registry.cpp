#include "cancel_registry.hpp"

// ── Registration ───────────────────────────────────────────────

CancelRegistry::Registration::Registration(CancelRegistry* registry, std::string id,
                                           std::shared_ptr<std::atomic<bool>> flag)
    : registry_(registry), id_(std::move(id)), flag_(std::move(flag)) {}

CancelRegistry::Registration::~Registration() {
    reset();
}

CancelRegistry::Registration::Registration(Registration&& other) noexcept
    : registry_(other.registry_), id_(std::move(other.id_)), flag_(std::move(other.flag_)) {
    other.registry_ = nullptr;
}

CancelRegistry::Registration&
CancelRegistry::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = other.registry_;
        id_ = std::move(other.id_);
        flag_ = std::move(other.flag_);
        other.registry_ = nullptr;
    }
    return *this;
}

void CancelRegistry::Registration::reset() {
    if (registry_) registry_->release(id_, flag_);
    registry_ = nullptr;
}

// ── Registry ───────────────────────────────────────────────────

CancelRegistry::CancelRegistry(std::string label, ErrorKind duplicate_kind, ErrorKind missing_kind)
    : label_(std::move(label)), duplicate_kind_(duplicate_kind), missing_kind_(missing_kind) {}

Result<CancelRegistry::Registration> CancelRegistry::acquire(const std::string& id,
                                                              const std::string& owner) {
    if (id.empty()) {
        return Result<Registration>::Err(ErrorKind::InvalidArgument, "register", id,
                                         label_ + " id must not be empty");
    }
    auto flag = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(id)) {
            return Result<Registration>::Err(duplicate_kind_, "register", id,
                                             label_ + " id already in flight");
        }
        entries_[id] = Entry{owner, flag};
    }
    return Result<Registration>::Ok(Registration(this, id, flag));
}

Result<void> CancelRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Result<void>::Err(missing_kind_, "cancel", id, "no " + label_ + " in flight with this id");
    }
    it->second.flag->store(true);
    return Result<void>::Ok();
}

int CancelRegistry::cancel_owned(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (auto& [_, entry] : entries_) {
        if (entry.owner == owner) {
            entry.flag->store(true);
            n++;
        }
    }
    return n;
}

void CancelRegistry::release(const std::string& id, const std::shared_ptr<std::atomic<bool>>& flag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    // Only drop the entry this registration created
    if (it != entries_.end() && it->second.flag == flag) entries_.erase(it);
}

bool CancelRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::optional<std::string> CancelRegistry::owner(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.owner;
}

std::vector<std::string> CancelRegistry::ids_for(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [id, entry] : entries_) {
        if (entry.owner == owner) out.push_back(id);
    }
    return out;
}

size_t CancelRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
