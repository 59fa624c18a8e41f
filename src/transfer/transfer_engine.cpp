#include "transfer_engine.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <session/sftp_ops.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include "integrity.hpp"
#include "progress_throttle.hpp"

namespace {

bool is_one_of(TransferStatus s, const std::vector<TransferStatus>& set) {
    return std::find(set.begin(), set.end(), s) != set.end();
}

// Returns the channel to its session on every exit path
struct ChannelLease {
    TransferBackend& backend;
    std::string session_id;
    std::shared_ptr<Channel> channel;

    ~ChannelLease() {
        if (channel) backend.release_channel(session_id, std::move(channel));
    }
};

std::string local_parent(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

std::string local_name(const std::string& path) {
    auto p = std::filesystem::path(path);
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

// Path of a remote file relative to the walked root
std::string remote_relative(const std::string& root, const std::string& path) {
    std::string prefix = root;
    if (prefix.empty() || prefix.back() != '/') prefix += '/';
    if (path.compare(0, prefix.size(), prefix) == 0) return path.substr(prefix.size());
    return remote_basename(path);
}

Error io_failure(const char* op, const std::string& id, const IoResult& r) {
    return make_error(r.fatal ? ErrorKind::SessionLost : ErrorKind::TransferIoError, op, id,
                      r.error.empty() ? "remote I/O failed" : r.error);
}

} // namespace

TransferEngine::TransferEngine(TransferBackend& backend, LocalStorage& storage,
                               const TransferSettings& settings, EventListener& events)
    : backend_(backend),
      storage_(storage),
      settings_(settings),
      events_(events),
      stops_("transfer", ErrorKind::InvalidArgument, ErrorKind::TransferNotFound) {}

TransferEngine::~TransferEngine() {
    shutdown();
}

void TransferEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scheduler_.joinable() || stopping_) return;
    scheduler_ = std::thread([this] { run(); });
}

void TransferEngine::shutdown() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        for (auto& [_, entry] : items_) {
            if (entry.item.status == TransferStatus::Running) stop_running_locked(entry, StopIntent::Pause);
        }
    }
    cv_.notify_all();
    if (scheduler_.joinable()) scheduler_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers = take_finished_locked(true);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void TransferEngine::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dirty_ = true;
    }
    cv_.notify_all();
}

// ── Admission ──────────────────────────────────────────────────

Result<std::string> TransferEngine::enqueue_upload(const std::string& session_id,
                                                   const std::string& local_path,
                                                   const std::string& remote_path) {
    using R = Result<std::string>;
    if (local_path.empty() || remote_path.empty()) {
        return R::Err(ErrorKind::InvalidArgument, "upload", local_path, "local and remote paths are required");
    }
    if (!backend_.has_session(session_id)) {
        return R::Err(ErrorKind::SessionNotFound, "upload", session_id, "no such session");
    }
    if (!storage_.exists(local_path)) {
        return R::Err(ErrorKind::TransferIoError, "upload", local_path, "local path does not exist");
    }

    std::vector<TransferItem> children;
    std::uint64_t size = 0;
    const bool is_dir = storage_.is_directory(local_path);
    if (is_dir) {
        auto tree = storage_.list_tree(local_path);
        if (tree.is_err()) return R::Err(tree.error);
        for (const auto& f : tree.value) {
            TransferItem child;
            child.name = remote_basename(f.relative);
            child.local_path = f.path;
            child.remote_path = join_remote(remote_path, f.relative);
            child.size = f.size;
            children.push_back(std::move(child));
        }
    } else {
        auto sz = storage_.size(local_path);
        if (sz.is_err()) return R::Err(sz.error);
        size = sz.value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return admit_locked(session_id, TransferDirection::Upload, local_name(local_path),
                        local_path, remote_path, size, is_dir, children);
}

Result<std::string> TransferEngine::enqueue_download(const std::string& session_id,
                                                     const std::string& remote_path,
                                                     const std::string& local_path) {
    using R = Result<std::string>;
    if (local_path.empty() || remote_path.empty()) {
        return R::Err(ErrorKind::InvalidArgument, "download", remote_path, "local and remote paths are required");
    }
    if (!backend_.has_session(session_id)) {
        return R::Err(ErrorKind::SessionNotFound, "download", session_id, "no such session");
    }

    auto ch = backend_.open_sftp(session_id);
    if (ch.is_err()) return R::Err(ch.error);
    ChannelLease lease{backend_, session_id, ch.value};
    SftpIo& sftp = *lease.channel->sftp();

    auto st = sftp.stat(remote_path);
    if (st.is_err()) return R::Err(st.error);

    std::vector<TransferItem> children;
    std::uint64_t size = st.value.size;
    if (st.value.is_dir) {
        auto files = walk_remote(sftp, remote_path);
        if (files.is_err()) return R::Err(files.error);
        std::sort(files.value.begin(), files.value.end(),
                  [](const RemoteEntry& a, const RemoteEntry& b) { return a.path < b.path; });

        for (const auto& f : files.value) {
            TransferItem child;
            child.name = f.name;
            child.remote_path = f.path;
            child.local_path = (std::filesystem::path(local_path) / remote_relative(remote_path, f.path)).string();
            child.size = f.size;
            children.push_back(std::move(child));
        }
        size = 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return admit_locked(session_id, TransferDirection::Download, remote_basename(remote_path),
                        local_path, remote_path, size, st.value.is_dir, children);
}

Result<std::string> TransferEngine::admit_locked(const std::string& session_id,
                                                 TransferDirection direction,
                                                 const std::string& name,
                                                 const std::string& local_path,
                                                 const std::string& remote_path,
                                                 std::uint64_t size, bool is_directory,
                                                 const std::vector<TransferItem>& children) {
    Entry top;
    top.item.id = generate_id("xfer");
    top.item.session_id = session_id;
    top.item.name = name;
    top.item.direction = direction;
    top.item.local_path = local_path;
    top.item.remote_path = remote_path;
    top.item.size = size;
    top.item.is_directory = is_directory;

    std::string id = top.item.id;
    items_[id] = top;
    order_.push_back(id);

    for (size_t i = 0; i < children.size(); i++) {
        Entry child;
        child.item = children[i];
        child.item.id = generate_id("xfer");
        child.item.session_id = session_id;
        child.item.direction = direction;
        child.item.parent_id = id;
        items_[id].item.child_ids.push_back(child.item.id);
        order_.push_back(child.item.id);
        items_[child.item.id] = std::move(child);
    }

    Entry& entry = items_[id];
    if (entry.item.is_directory) entry.item.status = status_locked(entry);

    hostlink_log(fmt::format("[transfer] queued {} {} {} -> {} ({} file(s))", id,
                             transfer_direction_name(direction),
                             direction == TransferDirection::Upload ? local_path : remote_path,
                             direction == TransferDirection::Upload ? remote_path : local_path,
                             entry.item.is_directory ? entry.item.child_ids.size() : 1));
    dirty_ = true;
    cv_.notify_all();
    return Result<std::string>::Ok(id);
}

// ── State helpers ──────────────────────────────────────────────

TransferEngine::Entry* TransferEngine::find_locked(const std::string& id) {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

const TransferEngine::Entry* TransferEngine::find_locked(const std::string& id) const {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

DirectoryAggregate TransferEngine::aggregate_locked(const Entry& dir) const {
    DirectoryAggregate agg;
    agg.paused_child_ids = dir.item.paused_child_ids;
    for (const auto& cid : dir.item.child_ids) {
        const Entry* child = find_locked(cid);
        if (!child) continue;
        agg.total_files++;
        agg.total_bytes += child->item.size;
        agg.transferred_bytes += child->item.transferred;
        if (child->item.status == TransferStatus::Completed) agg.completed_files++;
    }
    return agg;
}

TransferStatus TransferEngine::status_locked(const Entry& entry) const {
    if (!entry.item.is_directory) return entry.item.status;

    auto agg = aggregate_locked(entry);
    if (agg.completed_files == agg.total_files) return TransferStatus::Completed;
    if (entry.cancelled) return TransferStatus::Cancelled;

    bool running = false, waiting = false, failed = false, paused = false;
    for (const auto& cid : entry.item.child_ids) {
        const Entry* child = find_locked(cid);
        if (!child) continue;
        switch (child->item.status) {
            case TransferStatus::Running: running = true; break;
            case TransferStatus::Pending: waiting = true; break;
            case TransferStatus::Error:   failed = true; break;
            case TransferStatus::Paused:  paused = true; break;
            default: break;
        }
    }
    if (running) return TransferStatus::Running;
    if (entry.held) return TransferStatus::Paused;
    if (waiting) return TransferStatus::Pending;
    if (failed) return TransferStatus::Error;
    return paused ? TransferStatus::Paused : TransferStatus::Cancelled;
}

TransferSnapshot TransferEngine::snapshot_locked(const Entry& entry) const {
    TransferSnapshot snap;
    snap.item = entry.item;
    if (entry.item.is_directory) {
        auto agg = aggregate_locked(entry);
        snap.item.size = agg.total_bytes;
        snap.item.transferred = agg.transferred_bytes;
        snap.item.status = status_locked(entry);
        snap.aggregate = std::move(agg);
    }
    return snap;
}

void TransferEngine::set_status_locked(Entry& entry, TransferStatus status,
                                       std::optional<Error> error, Notes& notes) {
    entry.item.error = error;
    if (entry.item.status != status) {
        entry.item.status = status;
        Note n;
        n.id = entry.item.id;
        n.status = status;
        n.error = std::move(error);
        notes.push_back(std::move(n));
    }
    if (!entry.item.parent_id.empty()) refresh_parent_locked(entry.item.parent_id, notes);
}

// Directory status is cached in item.status only to detect changes worth an event
void TransferEngine::refresh_parent_locked(const std::string& parent_id, Notes& notes) {
    Entry* dir = find_locked(parent_id);
    if (!dir) return;
    auto derived = status_locked(*dir);
    if (derived == dir->item.status) return;
    dir->item.status = derived;

    Note n;
    n.id = dir->item.id;
    n.status = derived;
    if (derived == TransferStatus::Error) {
        for (const auto& cid : dir->item.child_ids) {
            const Entry* child = find_locked(cid);
            if (child && child->item.error) { n.error = child->item.error; break; }
        }
    }
    notes.push_back(std::move(n));
}

void TransferEngine::stop_running_locked(Entry& entry, StopIntent intent) {
    if (entry.intent != StopIntent::Cancel) entry.intent = intent;
    auto r = stops_.cancel(entry.item.id);
    if (r.is_err()) {
        hostlink_log(fmt::format("[transfer] stop {}: {}", entry.item.id, r.error.describe()));
    }
}

void TransferEngine::emit(const Notes& notes) {
    for (const auto& n : notes) {
        if (n.progress) {
            events_.transfer_progress(n.id, n.transferred, n.total);
        } else {
            events_.transfer_status_changed(n.id, n.status, n.error);
        }
    }
}

// ── Control ────────────────────────────────────────────────────

Result<void> TransferEngine::pause_locked(Entry& entry, Notes& notes) {
    const auto& id = entry.item.id;
    if (entry.item.is_directory) {
        auto status = status_locked(entry);
        if (status == TransferStatus::Completed || status == TransferStatus::Cancelled) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "pause", id,
                                     fmt::format("transfer is {}", transfer_status_name(status)));
        }
        entry.held = true;
        for (const auto& cid : entry.item.child_ids) {
            Entry* child = find_locked(cid);
            if (!child || child->item.status != TransferStatus::Running) continue;
            stop_running_locked(*child, StopIntent::Pause);
            auto& paused = entry.item.paused_child_ids;
            if (std::find(paused.begin(), paused.end(), cid) == paused.end()) paused.push_back(cid);
        }
        refresh_parent_locked(id, notes);
        return Result<void>::Ok();
    }

    if (entry.item.status != TransferStatus::Running) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "pause", id,
                                 fmt::format("transfer is {}", transfer_status_name(entry.item.status)));
    }
    stop_running_locked(entry, StopIntent::Pause);
    return Result<void>::Ok();
}

Result<void> TransferEngine::resume_locked(Entry& entry, Notes& notes) {
    const auto& id = entry.item.id;
    auto resumable = [](TransferStatus s) {
        return s == TransferStatus::Paused || s == TransferStatus::Error || s == TransferStatus::Cancelled;
    };

    if (entry.item.is_directory) {
        auto status = status_locked(entry);
        if (!resumable(status)) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "resume", id,
                                     fmt::format("transfer is {}", transfer_status_name(status)));
        }
        entry.held = false;
        entry.cancelled = false;
        for (const auto& cid : entry.item.child_ids) {
            Entry* child = find_locked(cid);
            if (!child || !resumable(child->item.status)) continue;
            child->item.resume = true;
            child->intent = StopIntent::None;
            set_status_locked(*child, TransferStatus::Pending, std::nullopt, notes);
        }
        entry.item.paused_child_ids.clear();
        refresh_parent_locked(id, notes);
        dirty_ = true;
        return Result<void>::Ok();
    }

    if (!resumable(entry.item.status)) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "resume", id,
                                 fmt::format("transfer is {}", transfer_status_name(entry.item.status)));
    }
    // Resuming one child lifts its directory's hold
    if (Entry* dir = find_locked(entry.item.parent_id)) {
        dir->held = false;
        dir->cancelled = false;
        auto& paused = dir->item.paused_child_ids;
        paused.erase(std::remove(paused.begin(), paused.end(), id), paused.end());
    }
    entry.item.resume = true;
    entry.intent = StopIntent::None;
    set_status_locked(entry, TransferStatus::Pending, std::nullopt, notes);
    dirty_ = true;
    return Result<void>::Ok();
}

Result<void> TransferEngine::cancel_locked(Entry& entry, Notes& notes) {
    const auto& id = entry.item.id;
    auto cancellable = [](TransferStatus s) {
        return s == TransferStatus::Running || s == TransferStatus::Paused || s == TransferStatus::Pending;
    };

    if (entry.item.is_directory) {
        auto status = status_locked(entry);
        if (status == TransferStatus::Completed || status == TransferStatus::Cancelled) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "cancel", id,
                                     fmt::format("transfer is {}", transfer_status_name(status)));
        }
        entry.held = false;
        entry.cancelled = true;
        entry.item.paused_child_ids.clear();
        for (const auto& cid : entry.item.child_ids) {
            Entry* child = find_locked(cid);
            if (!child || !cancellable(child->item.status)) continue;
            if (child->item.status == TransferStatus::Running) {
                stop_running_locked(*child, StopIntent::Cancel);
            } else {
                set_status_locked(*child, TransferStatus::Cancelled, std::nullopt, notes);
            }
        }
        refresh_parent_locked(id, notes);
        return Result<void>::Ok();
    }

    if (!cancellable(entry.item.status)) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "cancel", id,
                                 fmt::format("transfer is {}", transfer_status_name(entry.item.status)));
    }
    if (entry.item.status == TransferStatus::Running) {
        stop_running_locked(entry, StopIntent::Cancel);
    } else {
        set_status_locked(entry, TransferStatus::Cancelled, std::nullopt, notes);
    }
    return Result<void>::Ok();
}

Result<void> TransferEngine::remove_locked(Entry& entry, Notes&) {
    const std::string id = entry.item.id;
    if (!entry.item.parent_id.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "remove", id,
                                 "remove the directory transfer instead");
    }
    auto status = status_locked(entry);
    if (status == TransferStatus::Running || status == TransferStatus::Pending) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "remove", id,
                                 fmt::format("transfer is {}; cancel it first", transfer_status_name(status)));
    }
    if (entry.item.is_directory) {
        for (const auto& cid : entry.item.child_ids) {
            const Entry* child = find_locked(cid);
            if (child && child->item.status == TransferStatus::Running) {
                return Result<void>::Err(ErrorKind::InvalidArgument, "remove", id,
                                         "a file of this directory is still stopping");
            }
        }
    }

    std::vector<std::string> doomed = entry.item.child_ids;
    doomed.push_back(id);
    for (const auto& d : doomed) items_.erase(d);
    order_.erase(std::remove_if(order_.begin(), order_.end(),
                                [&](const std::string& o) {
                                    return std::find(doomed.begin(), doomed.end(), o) != doomed.end();
                                }),
                 order_.end());
    hostlink_log(fmt::format("[transfer] removed {}", id));
    return Result<void>::Ok();
}

Result<void> TransferEngine::apply(const std::string& id, const char* op, Action action) {
    Notes notes;
    Result<void> r = Result<void>::Ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = find_locked(id);
        if (!entry) return Result<void>::Err(ErrorKind::TransferNotFound, op, id, "no such transfer");
        r = (this->*action)(*entry, notes);
    }
    cv_.notify_all();
    emit(notes);
    return r;
}

Result<void> TransferEngine::pause(const std::string& transfer_id) {
    return apply(transfer_id, "pause", &TransferEngine::pause_locked);
}

Result<void> TransferEngine::resume(const std::string& transfer_id) {
    return apply(transfer_id, "resume", &TransferEngine::resume_locked);
}

Result<void> TransferEngine::cancel(const std::string& transfer_id) {
    return apply(transfer_id, "cancel", &TransferEngine::cancel_locked);
}

Result<void> TransferEngine::remove(const std::string& transfer_id) {
    return apply(transfer_id, "remove", &TransferEngine::remove_locked);
}

std::vector<BatchOutcome> TransferEngine::batch(const std::string& session_id, const char* op,
                                                const std::vector<TransferStatus>& eligible,
                                                Action action) {
    std::vector<BatchOutcome> outcomes;
    Notes notes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> targets;
        for (const auto& id : order_) {
            const Entry* e = find_locked(id);
            if (!e || !e->item.parent_id.empty() || e->item.session_id != session_id) continue;
            if (is_one_of(status_locked(*e), eligible)) targets.push_back(id);
        }
        for (const auto& id : targets) {
            Entry* e = find_locked(id);
            if (!e) continue;
            outcomes.push_back(BatchOutcome{id, (this->*action)(*e, notes)});
        }
    }
    cv_.notify_all();
    emit(notes);
    hostlink_log(fmt::format("[transfer] batch {} on {}: {} item(s)", op, session_id, outcomes.size()));
    return outcomes;
}

std::vector<BatchOutcome> TransferEngine::batch_pause(const std::string& session_id) {
    return batch(session_id, "pause", {TransferStatus::Running}, &TransferEngine::pause_locked);
}

std::vector<BatchOutcome> TransferEngine::batch_resume(const std::string& session_id) {
    return batch(session_id, "resume",
                 {TransferStatus::Paused, TransferStatus::Error, TransferStatus::Cancelled},
                 &TransferEngine::resume_locked);
}

std::vector<BatchOutcome> TransferEngine::batch_cancel(const std::string& session_id) {
    return batch(session_id, "cancel",
                 {TransferStatus::Running, TransferStatus::Paused, TransferStatus::Pending},
                 &TransferEngine::cancel_locked);
}

std::vector<BatchOutcome> TransferEngine::batch_delete(const std::string& session_id) {
    return batch(session_id, "delete",
                 {TransferStatus::Completed, TransferStatus::Cancelled, TransferStatus::Error,
                  TransferStatus::Paused},
                 &TransferEngine::remove_locked);
}

// ── Queries ────────────────────────────────────────────────────

std::vector<TransferSnapshot> TransferEngine::list(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferSnapshot> out;
    for (const auto& id : order_) {
        const Entry* e = find_locked(id);
        if (!e) continue;
        if (!session_id.empty() && e->item.session_id != session_id) continue;
        out.push_back(snapshot_locked(*e));
    }
    return out;
}

Result<TransferSnapshot> TransferEngine::get(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = find_locked(transfer_id);
    if (!e) return Result<TransferSnapshot>::Err(ErrorKind::TransferNotFound, "get", transfer_id, "no such transfer");
    return Result<TransferSnapshot>::Ok(snapshot_locked(*e));
}

int TransferEngine::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> finished;
    for (const auto& id : order_) {
        const Entry* e = find_locked(id);
        if (!e || !e->item.parent_id.empty()) continue;
        auto s = status_locked(*e);
        if (s == TransferStatus::Completed || s == TransferStatus::Error || s == TransferStatus::Cancelled) {
            finished.push_back(id);
        }
    }
    int removed = 0;
    Notes ignored;
    for (const auto& id : finished) {
        Entry* e = find_locked(id);
        if (e && remove_locked(*e, ignored).is_ok()) removed++;
    }
    return removed;
}

int TransferEngine::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

// ── Scheduler ──────────────────────────────────────────────────

void TransferEngine::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        cv_.wait_for(lock, std::chrono::milliseconds(250), [this] { return dirty_ || stopping_; });
        if (stopping_) break;
        dirty_ = false;

        auto finished = take_finished_locked(false);
        Notes notes;
        promote_locked(notes);

        lock.unlock();
        for (auto& w : finished) {
            if (w.thread.joinable()) w.thread.join();
        }
        emit(notes);
        lock.lock();
    }
}

std::vector<TransferEngine::Worker> TransferEngine::take_finished_locked(bool all) {
    std::vector<Worker> finished;
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (all || it->done->load()) {
            finished.push_back(std::move(*it));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

void TransferEngine::promote_locked(Notes& notes) {
    for (const auto& id : order_) {
        if (active_ >= settings_.concurrency) return;

        Entry* e = find_locked(id);
        if (!e || e->item.is_directory || e->item.status != TransferStatus::Pending) continue;
        if (const Entry* dir = find_locked(e->item.parent_id)) {
            if (dir->held || dir->cancelled) continue;
        }

        auto reg = stops_.acquire(id, e->item.session_id);
        if (reg.is_err()) {
            // Previous worker for this id has not released yet; retry next pass
            dirty_ = true;
            continue;
        }

        e->intent = StopIntent::None;
        set_status_locked(*e, TransferStatus::Running, std::nullopt, notes);
        active_++;

        Worker w;
        w.done = std::make_shared<std::atomic<bool>>(false);
        auto done = w.done;
        w.thread = std::thread([this, id, done, registration = std::move(reg.value)]() mutable {
            run_item(id, registration);
            done->store(true);
            wake();
        });
        workers_.push_back(std::move(w));
    }
}

void TransferEngine::run_item(const std::string& id, CancelRegistry::Registration& registration) {
    Job job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Entry* e = find_locked(id);
        if (!e) return;
        job.id = id;
        job.session_id = e->item.session_id;
        job.direction = e->item.direction;
        job.local_path = e->item.local_path;
        job.remote_path = e->item.remote_path;
        job.resume = e->item.resume;
    }

    hostlink_log(fmt::format("[transfer] start {} {}{}", id, transfer_direction_name(job.direction),
                             job.resume ? " (resume)" : ""));
    auto outcome = transfer_file(job, registration);
    finish_item(id, outcome, registration);
}

void TransferEngine::finish_item(const std::string& id, const Result<void>& outcome,
                                 CancelRegistry::Registration& registration) {
    Notes notes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
        Entry* e = find_locked(id);
        if (e) {
            if (outcome.is_ok()) {
                e->item.transferred = e->item.size;
                e->item.resume = false;
                set_status_locked(*e, TransferStatus::Completed, std::nullopt, notes);
            } else if (outcome.kind() == ErrorKind::Cancelled) {
                auto status = e->intent == StopIntent::Cancel ? TransferStatus::Cancelled
                                                              : TransferStatus::Paused;
                set_status_locked(*e, status, std::nullopt, notes);
            } else {
                set_status_locked(*e, TransferStatus::Error, outcome.error, notes);
            }
            e->intent = StopIntent::None;
        }
        // Released under the lock so a resumed item can be promoted straight away
        registration = CancelRegistry::Registration();
        dirty_ = true;
    }
    cv_.notify_all();

    if (outcome.is_ok()) {
        hostlink_log(fmt::format("[transfer] done {}", id));
    } else {
        hostlink_log(fmt::format("[transfer] stopped {}: {}", id, outcome.error.describe()));
    }
    emit(notes);
}

// ── Transfer I/O ───────────────────────────────────────────────

Result<std::shared_ptr<Channel>> TransferEngine::acquire_channel(const Job& job,
                                                                 const CancelRegistry::Registration& reg) {
    using R = Result<std::shared_ptr<Channel>>;
    for (;;) {
        if (reg.cancelled()) return R::Err(ErrorKind::Cancelled, "transfer", job.id, "stopped");
        auto ch = backend_.open_sftp(job.session_id);
        if (ch.is_ok() || ch.kind() != ErrorKind::ChannelLimitExceeded) {
            if (ch.is_err()) ch.error.id = job.id;
            return ch;
        }
        // Wait for a slot instead of failing the item
        platform::sleep_ms(TRANSFER_RETRY_DELAY_MS);
    }
}

Result<void> TransferEngine::transfer_file(const Job& job, const CancelRegistry::Registration& reg) {
    auto ch = acquire_channel(job, reg);
    if (ch.is_err()) return Result<void>::Err(ch.error);
    ChannelLease lease{backend_, job.session_id, ch.value};

    if (job.direction == TransferDirection::Upload) return upload(job, *lease.channel, reg);
    return download(job, *lease.channel, reg);
}

void TransferEngine::set_size(const std::string& id, std::uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Entry* e = find_locked(id)) e->item.size = size;
}

void TransferEngine::report_progress(const std::string& id, std::uint64_t transferred,
                                     std::uint64_t total, bool emit_sample) {
    Notes notes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* e = find_locked(id);
        if (!e) return;
        e->item.transferred = transferred;
        if (!emit_sample) return;

        Note n;
        n.id = id;
        n.progress = true;
        n.transferred = transferred;
        n.total = total;
        notes.push_back(n);

        if (const Entry* dir = find_locked(e->item.parent_id)) {
            auto agg = aggregate_locked(*dir);
            Note d;
            d.id = dir->item.id;
            d.progress = true;
            d.transferred = agg.transferred_bytes;
            d.total = agg.total_bytes;
            notes.push_back(d);
        }
    }
    emit(notes);
}

Result<void> TransferEngine::upload(const Job& job, Channel& channel,
                                    const CancelRegistry::Registration& reg) {
    SftpIo& sftp = *channel.sftp();

    auto total_r = storage_.size(job.local_path);
    if (total_r.is_err()) return Result<void>::Err(total_r.error);
    const std::uint64_t total = total_r.value;
    set_size(job.id, total);

    auto dirs = make_remote_dirs(sftp, remote_parent(job.remote_path));
    if (dirs.is_err()) return dirs;

    std::uint64_t offset = 0;
    if (job.resume) {
        auto st = sftp.stat(job.remote_path);
        if (st.is_ok() && !st.value.is_dir && st.value.size <= total) offset = st.value.size;
        else if (st.kind() == ErrorKind::SessionLost) return Result<void>::Err(st.error);
    }

    auto remote = sftp.open(job.remote_path, offset > 0 ? OpenMode::WriteAt : OpenMode::WriteTruncate, offset);
    if (remote.is_err()) return Result<void>::Err(remote.error);
    auto local = storage_.open(job.local_path, LocalStorage::Mode::Read, offset);
    if (local.is_err()) {
        remote.value->close();
        return Result<void>::Err(local.error);
    }
    if (offset > 0) {
        hostlink_log(fmt::format("[transfer] {} resuming upload at {} of {}", job.id, offset, total));
    }

    ProgressThrottle throttle(settings_.progress_interval_ms, settings_.progress_bytes);
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    std::uint64_t done = offset;
    report_progress(job.id, done, total, throttle.should_emit(done, total));

    auto fail = [&](Error err) {
        remote.value->close();
        local.value->close();
        return Result<void>::Err(std::move(err));
    };

    for (;;) {
        if (reg.cancelled()) return fail(make_error(ErrorKind::Cancelled, "upload", job.id, "stopped"));
        if (channel.invalidated()) {
            return fail(make_error(ErrorKind::SessionLost, "upload", job.id, channel.invalidation_reason()));
        }

        auto n = local.value->read(buf.data(), buf.size());
        if (n.is_err()) return fail(n.error);
        if (n.value == 0) break;

        size_t sent = 0;
        while (sent < n.value) {
            if (reg.cancelled()) return fail(make_error(ErrorKind::Cancelled, "upload", job.id, "stopped"));
            auto w = remote.value->write(buf.data() + sent, n.value - sent);
            if (w.status == IoStatus::Ok) {
                sent += w.bytes;
            } else if (w.status == IoStatus::Again) {
                platform::sleep_ms(1);
            } else {
                return fail(io_failure("upload", job.id, w));
            }
        }
        done += n.value;
        report_progress(job.id, done, total, throttle.should_emit(done, total));
    }

    remote.value->close();
    auto closed = local.value->close();
    if (closed.is_err()) return closed;
    if (done != total) report_progress(job.id, done, total, true);

    return verify(job, sftp, offset, total);
}

Result<void> TransferEngine::download(const Job& job, Channel& channel,
                                      const CancelRegistry::Registration& reg) {
    SftpIo& sftp = *channel.sftp();

    auto st = sftp.stat(job.remote_path);
    if (st.is_err()) return Result<void>::Err(st.error);
    if (st.value.is_dir) {
        return Result<void>::Err(ErrorKind::TransferIoError, "download", job.id, "remote path is a directory");
    }
    const std::uint64_t total = st.value.size;
    set_size(job.id, total);

    auto dirs = storage_.make_dirs(local_parent(job.local_path));
    if (dirs.is_err()) return dirs;

    std::uint64_t offset = 0;
    if (job.resume && storage_.exists(job.local_path)) {
        auto partial = storage_.size(job.local_path);
        if (partial.is_ok() && partial.value <= total) offset = partial.value;
    }

    auto remote = sftp.open(job.remote_path, OpenMode::Read, offset);
    if (remote.is_err()) return Result<void>::Err(remote.error);
    auto local = storage_.open(job.local_path,
                               offset > 0 ? LocalStorage::Mode::WriteAt : LocalStorage::Mode::WriteTruncate,
                               offset);
    if (local.is_err()) {
        remote.value->close();
        return Result<void>::Err(local.error);
    }
    if (offset > 0) {
        hostlink_log(fmt::format("[transfer] {} resuming download at {} of {}", job.id, offset, total));
    }

    ProgressThrottle throttle(settings_.progress_interval_ms, settings_.progress_bytes);
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    std::uint64_t done = offset;
    report_progress(job.id, done, total, throttle.should_emit(done, total));

    auto fail = [&](Error err) {
        remote.value->close();
        local.value->close();
        return Result<void>::Err(std::move(err));
    };

    for (;;) {
        if (reg.cancelled()) return fail(make_error(ErrorKind::Cancelled, "download", job.id, "stopped"));
        if (channel.invalidated()) {
            return fail(make_error(ErrorKind::SessionLost, "download", job.id, channel.invalidation_reason()));
        }

        auto r = remote.value->read(buf.data(), buf.size());
        if (r.status == IoStatus::Again) {
            platform::sleep_ms(1);
            continue;
        }
        if (r.status == IoStatus::Eof) break;
        if (r.status == IoStatus::Error) return fail(io_failure("download", job.id, r));

        auto w = local.value->write(buf.data(), r.bytes);
        if (w.is_err()) return fail(w.error);
        done += r.bytes;
        report_progress(job.id, done, total, throttle.should_emit(done, total));
    }

    remote.value->close();
    auto closed = local.value->close();
    if (closed.is_err()) return closed;
    if (done != total) report_progress(job.id, done, total, true);

    return verify(job, sftp, offset, total);
}

// Size is always checked; content is hashed when the transfer continued a
// partial destination, since only then can stale bytes survive.
Result<void> TransferEngine::verify(const Job& job, SftpIo& sftp, std::uint64_t offset,
                                    std::uint64_t total) {
    std::uint64_t dest_size = 0;
    if (job.direction == TransferDirection::Upload) {
        auto st = sftp.stat(job.remote_path);
        if (st.is_err()) return Result<void>::Err(st.error);
        dest_size = st.value.size;
    } else {
        auto sz = storage_.size(job.local_path);
        if (sz.is_err()) return Result<void>::Err(sz.error);
        dest_size = sz.value;
    }
    if (dest_size != total) {
        return Result<void>::Err(ErrorKind::IntegrityError, "verify", job.id,
                                 fmt::format("size mismatch: expected {} bytes, destination has {}",
                                             total, dest_size));
    }

    if (offset == 0 || settings_.integrity != IntegrityMode::Sha256) return Result<void>::Ok();

    auto local_hash = sha256_local(storage_, job.local_path);
    if (local_hash.is_err()) return Result<void>::Err(local_hash.error);

    auto remote_hash = backend_.remote_sha256(job.session_id, job.remote_path);
    if (remote_hash.is_err()) {
        if (remote_hash.kind() == ErrorKind::SessionLost) return Result<void>::Err(remote_hash.error);
        hostlink_log(fmt::format("[transfer] {} remote hash unavailable, size check only: {}",
                                 job.id, remote_hash.error.describe()));
        return Result<void>::Ok();
    }
    if (remote_hash.value != local_hash.value) {
        return Result<void>::Err(ErrorKind::IntegrityError, "verify", job.id,
                                 fmt::format("sha256 mismatch: local {} remote {}",
                                             local_hash.value, remote_hash.value));
    }
    hostlink_log(fmt::format("[transfer] {} verified sha256 {}", job.id, local_hash.value));
    return Result<void>::Ok();
}
