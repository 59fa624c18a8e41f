#include "utils.hpp"
#include <cstdint>
#include <random>
#include <mutex>
#include <fmt/format.h>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string generate_id(const std::string& prefix) {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t v;
    {
        std::lock_guard<std::mutex> lock(mtx);
        v = rng();
    }
    return fmt::format("{}-{:016x}", prefix, v);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    std::string base = dir;
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    std::string leaf = name;
    while (!leaf.empty() && leaf.front() == '/') leaf.erase(leaf.begin());
    if (base == "/") return "/" + leaf;
    return base + "/" + leaf;
}

std::string remote_parent(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string remote_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}
