#pragma once

#include <chrono>
#include <cstdint>

// Decides which raw progress samples are worth emitting: one per interval
// or per byte step, whichever comes first. The final sample always passes.
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    ProgressThrottle(int interval_ms, std::int64_t byte_step)
        : interval_(std::chrono::milliseconds(interval_ms)), byte_step_(byte_step) {}

    bool should_emit(std::uint64_t transferred, std::uint64_t total, Clock::time_point now = Clock::now()) {
        bool final_sample = total > 0 && transferred >= total;
        if (!final_sample && emitted_once_) {
            bool time_due = now - last_time_ >= interval_;
            bool bytes_due = byte_step_ > 0 &&
                             transferred - last_bytes_ >= static_cast<std::uint64_t>(byte_step_);
            if (!time_due && !bytes_due) return false;
        }
        if (final_sample && final_sent_) return false;
        emitted_once_ = true;
        final_sent_ = final_sample;
        last_time_ = now;
        last_bytes_ = transferred;
        return true;
    }

private:
    Clock::duration interval_;
    std::int64_t byte_step_;
    Clock::time_point last_time_;
    std::uint64_t last_bytes_ = 0;
    bool emitted_once_ = false;
    bool final_sent_ = false;
};
