#pragma once
/**
 * @file log.hpp
 * @brief Tiny leveled logger: one key=value line per event.
 *
 * @details
 * The library never prints on its own initiative except through this module, and
 * everything it prints is a single grep-friendly line:
 *
 *     level=error msg="parse failed" from=10.0.0.2:9999 reason=bad_checksum rx="C0 69 ..."
 *
 * The threshold and the sink are process-wide. The default sink writes to std::cerr;
 * tests and embedding programs install their own with set_sink().
 *
 * Use the PUMPLINK_LOG_* macros rather than write(): they skip building the line when
 * the level is filtered out.
 * @code
 *   PUMPLINK_LOG_WARN("msg=\"rx from unexpected host\" host=" << host);
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace pumplink {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string&)>;

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Replace the output sink. An empty function restores the std::cerr sink.
void set_sink(Sink sink);

/// Emit one line (without trailing newline) at @p lvl, subject to the threshold.
void write(Level lvl, const std::string& line);

const char* level_name(Level lvl);

/// Accepts debug|info|warn|error|off. Returns false and leaves @p out untouched otherwise.
bool parse_level(const std::string& name, Level& out);

} // namespace log
} // namespace pumplink

#define PUMPLINK_LOG(lvl, expr)                                     \
    do {                                                            \
        if (::pumplink::log::enabled(lvl)) {                        \
            std::ostringstream pumplink_log_os_;                    \
            pumplink_log_os_ << expr;                               \
            ::pumplink::log::write(lvl, pumplink_log_os_.str());    \
        }                                                           \
    } while (0)

#define PUMPLINK_LOG_DEBUG(expr) PUMPLINK_LOG(::pumplink::log::Level::Debug, expr)
#define PUMPLINK_LOG_INFO(expr)  PUMPLINK_LOG(::pumplink::log::Level::Info, expr)
#define PUMPLINK_LOG_WARN(expr)  PUMPLINK_LOG(::pumplink::log::Level::Warn, expr)
#define PUMPLINK_LOG_ERROR(expr) PUMPLINK_LOG(::pumplink::log::Level::Error, expr)
