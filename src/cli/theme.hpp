#pragma once

#include <string>
#include <fmt/format.h>

// Terminal styling for the REPL. Everything returns a finished string so
// callers can build output with plain stream insertion.
namespace theme {

enum class Tone { Accent, Heading, Good, Warn, Bad, Muted, Strong };

// Raw SGR sequence for a tone (24-bit slate and amber, 16-colour status)
inline const char* escape(Tone tone) {
    switch (tone) {
        case Tone::Accent:  return "\033[38;2;74;122;150m";
        case Tone::Heading: return "\033[1;38;2;176;130;47m";
        case Tone::Good:    return "\033[92m";
        case Tone::Warn:    return "\033[93m";
        case Tone::Bad:     return "\033[91m";
        case Tone::Muted:   return "\033[2m";
        case Tone::Strong:  return "\033[1m";
    }
    return "";
}

inline const char* reset() { return "\033[0m"; }

inline std::string paint(Tone tone, const std::string& s) {
    return escape(tone) + s + reset();
}

inline std::string accent(const std::string& s) { return paint(Tone::Accent, s); }
inline std::string muted(const std::string& s)  { return paint(Tone::Muted, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line = "  ";
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return muted(line) + "\n";
}

// Clears the screen, then name, tagline and rule
inline std::string banner() {
    return "\033[2J\033[H\n"
         + paint(Tone::Accent, "\033[1m  hostlink") + "\n"
         + muted("  v0.1.0\n  Remote sessions, commands and transfers over SSH") + "\n\n"
         + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + paint(Tone::Heading, "  " + title) + "\n\n";
}

inline std::string divider() { return "\n" + rule() + "\n"; }

// Name column plus muted description, for help and usage listings
inline std::string command_row(const std::string& name, const std::string& desc, int width = 14) {
    return "    " + accent(fmt::format("{:<{}}", name, width)) + muted(desc) + "\n";
}

// ── Status lines ────────────────────────────────────────

inline std::string marked(Tone tone, const char* glyph, const std::string& msg) {
    return "    " + paint(tone, glyph) + " " + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return marked(Tone::Good, "+", msg); }
inline std::string fail(const std::string& msg) { return marked(Tone::Bad, "x", msg); }
inline std::string info(const std::string& msg) { return marked(Tone::Accent, "~", msg); }
inline std::string step(const std::string& msg) { return marked(Tone::Heading, ">", msg); }

// Asynchronous event line (shell output, progress, status changes)
inline std::string event(const std::string& tag, const std::string& msg) {
    return "    " + muted("[" + tag + "]") + " " + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return "    " + muted(fmt::format("{:<10}", key)) + value + "\n";
}

// Fixed-width usage bar; green below 70%, yellow below 90%, red above
inline std::string meter(double percent, int width = 20) {
    if (percent < 0) percent = 0;
    if (percent > 100) percent = 100;
    int filled = static_cast<int>(percent * width / 100.0 + 0.5);
    Tone tone = percent < 70 ? Tone::Good : percent < 90 ? Tone::Warn : Tone::Bad;
    return "[" + paint(tone, std::string(filled, '#')) + muted(std::string(width - filled, '.')) + "] "
         + fmt::format("{:.1f}%", percent);
}

} // namespace theme
