#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Random identifier with a readable prefix, e.g. "sess-3f9a0c1e7b2d4a55".
std::string generate_id(const std::string& prefix);

// Single-quote a string for a POSIX shell.
std::string shell_quote(const std::string& s);

// Join remote path components with exactly one '/'.
std::string join_remote(const std::string& dir, const std::string& name);

// Parent directory of a remote path ("" for a bare name, "/" for "/x").
std::string remote_parent(const std::string& path);

// Final component of a remote path.
std::string remote_basename(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
