#include "remote_info.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

// ── System status ──────────────────────────────────────────────

// /proc/stat "cpu" lines carry ten counters, so the second sample starts at
// field 12 of the joined line.
std::string system_status_command() {
    return R"SH(export LC_ALL=C
echo UPTIME_START; (uptime -p 2>/dev/null || uptime 2>/dev/null); echo UPTIME_END
echo MOUNTS_START; df -Ph 2>/dev/null | awk 'NR>1 {print $1 "|" $2 "|" $3 "|" $4 "|" $5 "|" $6}'; echo MOUNTS_END
echo IP_START; (hostname -I 2>/dev/null || echo n/a); echo IP_END
echo CPU_START
CPU1=$(grep '^cpu ' /proc/stat 2>/dev/null); sleep 0.1; CPU2=$(grep '^cpu ' /proc/stat 2>/dev/null)
if [ -n "$CPU1" ] && [ -n "$CPU2" ]; then
  echo "$CPU1 $CPU2" | awk '{b1=$2+$3+$4; t1=b1+$5+$6; b2=$13+$14+$15; t2=b2+$16+$17; if (t2-t1 > 0) printf "%.1f", (b2-b1)*100/(t2-t1); else print "0"}'
else
  echo 0
fi
echo; echo CPU_END
echo MEMORY_START
awk '/MemTotal:/ {t=$2} /MemAvailable:/ {a=$2} END {if (t>0) {u=t-a; printf "%.1f%%|%.1fGB|%.1fGB|%.1fGB", u/t*100, t/1048576, u/1048576, a/1048576} else print "0%|0|0|0"}' /proc/meminfo 2>/dev/null
echo; echo MEMORY_END
echo PROCESSES_START; ps aux --sort=-%cpu --no-headers 2>/dev/null | head -5 | awk '{printf "%s|%s|%s%%|%s%%|%.1fMB\n", $2, $11, $3, $4, $6/1024}'; echo PROCESSES_END
echo MEMORY_PROCESSES_START; ps aux --sort=-%mem --no-headers 2>/dev/null | head -5 | awk '{printf "%s|%s|%s%%|%s%%|%.1fMB\n", $2, $11, $3, $4, $6/1024}'; echo MEMORY_PROCESSES_END
)SH";
}

std::string extract_section(const std::string& output, const std::string& name) {
    const std::string start_tag = name + "_START";
    const std::string end_tag = name + "_END";

    // MEMORY_START must not match inside MEMORY_PROCESSES_START
    size_t pos = 0;
    for (;;) {
        pos = output.find(start_tag, pos);
        if (pos == std::string::npos) return "";
        bool boundary = pos == 0 || !(std::isalnum(static_cast<unsigned char>(output[pos - 1])) ||
                                      output[pos - 1] == '_');
        if (boundary) break;
        pos += start_tag.size();
    }

    size_t begin = pos + start_tag.size();
    size_t end = output.find(end_tag, begin);
    if (end == std::string::npos) return "";
    std::string section = output.substr(begin, end - begin);
    trim(section);
    return section;
}

// Pipe-separated rows with at least min_fields fields
static std::vector<std::vector<std::string>> split_rows(const std::string& text, size_t min_fields) {
    std::vector<std::vector<std::string>> rows;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::istringstream lss(line);
        std::string field;
        while (std::getline(lss, field, '|')) fields.push_back(field);
        if (fields.size() >= min_fields) rows.push_back(std::move(fields));
    }
    return rows;
}

static std::vector<ProcessInfo> parse_processes(const std::string& text) {
    std::vector<ProcessInfo> out;
    for (auto& f : split_rows(text, 5)) {
        ProcessInfo p;
        p.pid = f[0];
        p.command = f[1];
        p.cpu_percent = f[2];
        p.mem_percent = f[3];
        p.rss = f[4];
        out.push_back(std::move(p));
    }
    return out;
}

SystemStatus parse_system_status(const std::string& output) {
    SystemStatus status;

    std::string uptime = extract_section(output, "UPTIME");
    if (!uptime.empty()) status.uptime = uptime;

    std::istringstream ips(extract_section(output, "IP"));
    std::string ip;
    if (ips >> ip) status.ip = ip;

    std::string cpu = extract_section(output, "CPU");
    char* end = nullptr;
    double usage = std::strtod(cpu.c_str(), &end);
    if (end != cpu.c_str()) status.cpu_usage = std::clamp(usage, 0.0, 100.0);

    auto mem = split_rows(extract_section(output, "MEMORY"), 4);
    if (!mem.empty()) {
        MemoryInfo m;
        m.usage = mem[0][0];
        m.total = mem[0][1];
        m.used = mem[0][2];
        m.available = mem[0][3];
        status.memory = m;
    }

    for (auto& f : split_rows(extract_section(output, "MOUNTS"), 6)) {
        DiskInfo d;
        d.filesystem = f[0];
        d.size = f[1];
        d.used = f[2];
        d.avail = f[3];
        d.percent = f[4];
        d.mount = f[5];
        status.mounts.push_back(std::move(d));
    }
    auto root = std::find_if(status.mounts.begin(), status.mounts.end(),
                             [](const DiskInfo& d) { return d.mount == "/"; });
    if (root != status.mounts.end()) status.root_disk = *root;
    else if (!status.mounts.empty()) status.root_disk = status.mounts.front();

    status.top_cpu = parse_processes(extract_section(output, "PROCESSES"));
    status.top_memory = parse_processes(extract_section(output, "MEMORY_PROCESSES"));
    return status;
}

// ── Search ─────────────────────────────────────────────────────

std::string search_command(const std::string& root, const std::string& pattern, int max_results) {
    return fmt::format("cd {} && grep -R -n --text -- {} . | head -n {}",
                       shell_quote(root), shell_quote(pattern), max_results);
}

std::vector<SearchMatch> parse_search_output(const std::string& output) {
    std::vector<SearchMatch> matches;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // The path may itself contain ':'; take the first ":<digits>:"
        size_t colon = line.find(':');
        while (colon != std::string::npos) {
            size_t next = line.find(':', colon + 1);
            if (next == std::string::npos) break;
            std::string digits = line.substr(colon + 1, next - colon - 1);
            bool numeric = !digits.empty() &&
                std::all_of(digits.begin(), digits.end(),
                            [](unsigned char c) { return std::isdigit(c); });
            if (numeric) {
                SearchMatch m;
                m.path = line.substr(0, colon);
                if (m.path.rfind("./", 0) == 0) m.path.erase(0, 2);
                m.line = safe_stoi(digits);
                m.text = line.substr(next + 1);
                matches.push_back(std::move(m));
                break;
            }
            colon = next;
        }
    }
    return matches;
}
