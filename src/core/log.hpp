#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <mutex>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log path: $HOSTLINK_LOG, else <tmp>/hostlink_debug.log
inline std::string hostlink_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("HOSTLINK_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "hostlink_debug.log").string();
    }();
    return path;
}

inline void hostlink_log(const std::string& msg) {
    static std::mutex log_mutex;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(hostlink_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void hostlink_log_exec(const std::string& label, const std::string& cmd,
                              const Result<ExecOutput>& r) {
    hostlink_log(fmt::format("{} CMD: {}", label, cmd));
    if (r.is_err()) {
        hostlink_log(fmt::format("{} error={}", label, r.error.describe()));
        return;
    }
    hostlink_log(fmt::format("{} exit={} stdout({})={}", label, r.value.exit_status,
                             r.value.stdout_data.size(), r.value.stdout_data.substr(0, 500)));
    if (!r.value.stderr_data.empty())
        hostlink_log(fmt::format("{} stderr={}", label, r.value.stderr_data.substr(0, 500)));
}
