#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/cancel_registry.hpp>
#include <core/config.hpp>
#include <session/events.hpp>
#include "local_storage.hpp"
#include "transfer_backend.hpp"
#include "transfer_item.hpp"

// TransferEngine: queue and scheduler for uploads and downloads.
//
// A scheduler thread promotes the earliest Pending file while fewer than
// transfers.concurrency workers run; each worker owns one SFTP channel for
// the lifetime of its item. Directory transfers are expanded at admission
// into an aggregate plus one child per file; the aggregate never does I/O
// and its size, progress and status are derived from the children.
//
// Pause and cancel are cooperative: the worker notices its stop flag between
// chunks and the item settles into Paused or Cancelled when it exits.
// Resumed items continue from the destination's partial length and are
// verified once complete.
class TransferEngine {
public:
    TransferEngine(TransferBackend& backend, LocalStorage& storage,
                   const TransferSettings& settings, EventListener& events);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void start();

    // Stop scheduling, pause running workers and join them.
    void shutdown();

    Result<std::string> enqueue_upload(const std::string& session_id, const std::string& local_path,
                                       const std::string& remote_path);
    Result<std::string> enqueue_download(const std::string& session_id, const std::string& remote_path,
                                         const std::string& local_path);

    Result<void> pause(const std::string& transfer_id);
    Result<void> resume(const std::string& transfer_id);
    Result<void> cancel(const std::string& transfer_id);
    Result<void> remove(const std::string& transfer_id);

    // Applied to the session's top-level items whose status qualifies.
    std::vector<BatchOutcome> batch_pause(const std::string& session_id);
    std::vector<BatchOutcome> batch_resume(const std::string& session_id);
    std::vector<BatchOutcome> batch_cancel(const std::string& session_id);
    std::vector<BatchOutcome> batch_delete(const std::string& session_id);

    // Admission order; an empty session id lists every session.
    std::vector<TransferSnapshot> list(const std::string& session_id = "") const;
    Result<TransferSnapshot> get(const std::string& transfer_id) const;

    // Drop top-level items that are Completed, Error or Cancelled.
    int clear_history();

    int running_count() const;

private:
    enum class StopIntent { None, Pause, Cancel };

    struct Entry {
        TransferItem item;
        StopIntent intent = StopIntent::None;
        bool held = false;          // directory paused: children are not promoted
        bool cancelled = false;     // directory cancelled
    };

    struct Job {
        std::string id;
        std::string session_id;
        TransferDirection direction;
        std::string local_path;
        std::string remote_path;
        bool resume = false;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct Note {
        std::string id;
        bool progress = false;
        TransferStatus status = TransferStatus::Pending;
        std::optional<Error> error;
        std::uint64_t transferred = 0;
        std::uint64_t total = 0;
    };
    using Notes = std::vector<Note>;

    using Action = Result<void> (TransferEngine::*)(Entry&, Notes&);

    // ── Scheduler ──────────────────────────────────────────────

    void run();
    void promote_locked(Notes& notes);
    std::vector<Worker> take_finished_locked(bool all);
    void run_item(const std::string& id, CancelRegistry::Registration& registration);
    void finish_item(const std::string& id, const Result<void>& outcome,
                     CancelRegistry::Registration& registration);

    // ── Transfer I/O ───────────────────────────────────────────

    Result<std::shared_ptr<Channel>> acquire_channel(const Job& job,
                                                     const CancelRegistry::Registration& reg);
    Result<void> transfer_file(const Job& job, const CancelRegistry::Registration& reg);
    Result<void> upload(const Job& job, Channel& channel, const CancelRegistry::Registration& reg);
    Result<void> download(const Job& job, Channel& channel, const CancelRegistry::Registration& reg);
    Result<void> verify(const Job& job, SftpIo& sftp, std::uint64_t offset, std::uint64_t total);
    void set_size(const std::string& id, std::uint64_t size);
    void report_progress(const std::string& id, std::uint64_t transferred, std::uint64_t total,
                         bool emit_sample);

    // ── State helpers (mutex_ held) ────────────────────────────

    Result<std::string> admit_locked(const std::string& session_id, TransferDirection direction,
                                     const std::string& name, const std::string& local_path,
                                     const std::string& remote_path, std::uint64_t size,
                                     bool is_directory, const std::vector<TransferItem>& children);
    Entry* find_locked(const std::string& id);
    const Entry* find_locked(const std::string& id) const;
    DirectoryAggregate aggregate_locked(const Entry& dir) const;
    TransferStatus status_locked(const Entry& entry) const;
    TransferSnapshot snapshot_locked(const Entry& entry) const;
    void set_status_locked(Entry& entry, TransferStatus status, std::optional<Error> error, Notes& notes);
    void refresh_parent_locked(const std::string& parent_id, Notes& notes);
    void stop_running_locked(Entry& entry, StopIntent intent);

    Result<void> pause_locked(Entry& entry, Notes& notes);
    Result<void> resume_locked(Entry& entry, Notes& notes);
    Result<void> cancel_locked(Entry& entry, Notes& notes);
    Result<void> remove_locked(Entry& entry, Notes& notes);

    Result<void> apply(const std::string& id, const char* op, Action action);
    std::vector<BatchOutcome> batch(const std::string& session_id, const char* op,
                                    const std::vector<TransferStatus>& eligible, Action action);

    void emit(const Notes& notes);
    void wake();

    TransferBackend& backend_;
    LocalStorage& storage_;
    const TransferSettings settings_;
    EventListener& events_;
    CancelRegistry stops_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Entry> items_;
    std::vector<std::string> order_;
    int active_ = 0;
    bool dirty_ = false;
    bool stopping_ = false;
    std::vector<Worker> workers_;
    std::thread scheduler_;
};
