#include <ulidkit/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace ulidkit::log {

// Generators log from whichever thread hit the condition, so the
// threshold is atomic and each line is written under one lock.
static std::atomic<int> s_level{Info};
static std::once_flag s_color_once;
static std::atomic<bool> s_color_enabled{false};
static std::mutex s_write_mutex;

static void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled = isatty(fileno(stderr)) != 0;
    });
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

void set_color_enabled(bool enabled) {
    init_color();
    s_color_enabled = enabled;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return UlidError{UlidError::InvalidArg,
        "unknown log level: '" + name + "'",
        "expected one of trace, debug, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;
    init_color();

    std::lock_guard<std::mutex> lock(s_write_mutex);
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace ulidkit::log
