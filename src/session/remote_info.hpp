#pragma once

#include <optional>
#include <string>
#include <vector>

// Exec-backed host queries: system status, content search, working
// directory. Each builds one shell command and parses its stdout.

struct DiskInfo {
    std::string filesystem;
    std::string size;
    std::string used;
    std::string avail;
    std::string percent;
    std::string mount;
};

struct ProcessInfo {
    std::string pid;
    std::string command;
    std::string cpu_percent;
    std::string mem_percent;
    std::string rss;            // e.g. "12.5MB"
};

struct MemoryInfo {
    std::string usage;          // e.g. "42.0%"
    std::string total;
    std::string used;
    std::string available;
};

struct SystemStatus {
    std::string uptime = "N/A";
    std::string ip = "N/A";
    double cpu_usage = 0.0;                 // percent, clamped to 0-100
    std::optional<MemoryInfo> memory;
    std::vector<DiskInfo> mounts;
    std::optional<DiskInfo> root_disk;      // "/" or the first mount
    std::vector<ProcessInfo> top_cpu;
    std::vector<ProcessInfo> top_memory;
};

// One shell line printing each section between NAME_START / NAME_END
// markers: UPTIME, MOUNTS, IP, CPU, MEMORY, PROCESSES, MEMORY_PROCESSES.
std::string system_status_command();

// Text between NAME_START and the next NAME_END, trimmed. Empty when the
// section is missing.
std::string extract_section(const std::string& output, const std::string& name);

SystemStatus parse_system_status(const std::string& output);

// ── Search ─────────────────────────────────────────────────────

struct SearchMatch {
    std::string path;           // relative to the search root
    int line = 0;
    std::string text;
};

// grep -R -n below root, at most max_results lines
std::string search_command(const std::string& root, const std::string& pattern, int max_results);

// Parse "path:line:text" lines; lines without a line number are skipped.
std::vector<SearchMatch> parse_search_output(const std::string& output);
