#include "pumplink/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace pumplink {
namespace log {

// Threshold is read on every macro expansion, so keep it lock-free.
static std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Warn)};

static std::mutex g_sink_mutex;
static Sink       g_sink;

void set_level(Level lvl) { g_level.store(static_cast<uint8_t>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<uint8_t>(lvl) >= g_level.load();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void write(Level lvl, const std::string& line) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(g_sink_mutex);   // also keeps cerr lines whole
    if (g_sink) {
        g_sink(lvl, line);
        return;
    }
    std::cerr << "level=" << level_name(lvl) << ' ' << line << '\n';
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "?";
}

bool parse_level(const std::string& name, Level& out) {
    if      (name == "debug") out = Level::Debug;
    else if (name == "info")  out = Level::Info;
    else if (name == "warn")  out = Level::Warn;
    else if (name == "error") out = Level::Error;
    else if (name == "off")   out = Level::Off;
    else return false;
    return true;
}

} // namespace log
} // namespace pumplink
