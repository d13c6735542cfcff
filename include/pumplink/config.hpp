#pragma once
/**
 * @file config.hpp
 * @brief Application settings: JSON file under the XDG config dir, overridden by CLI options.
 *
 * Example file:
 * @code{.json}
 * {
 *   "host": "192.168.1.40",
 *   "dialect": "symmetric",
 *   "peer_policy": "adopt",
 *   "log_level": "info",
 *   "timeout_ms": 3000,
 *   "interval_ms": 1000,
 *   "registers": [40004, 40008]
 * }
 * @endcode
 *
 * "dialect" is applied before explicit "port_read"/"port_write", so the two can be mixed.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "pumplink/connection.hpp"
#include "pumplink/log.hpp"

namespace pumplink {

struct AppConfig {
    ConnectionConfig      connection{};
    log::Level            log_level{log::Level::Warn};
    int                   timeout_ms{3000};    ///< per-request response timeout
    int                   interval_ms{1000};   ///< monitor polling interval
    std::vector<uint16_t> registers{};         ///< monitor register list
};

namespace config {

/// $XDG_CONFIG_HOME/pumplink/config.json, or ~/.config/pumplink/config.json.
std::string default_config_path();

/**
 * @brief Apply a JSON document on top of @p cfg.
 *
 * Missing keys keep their current value. Unknown keys are ignored.
 * On failure @p err names the offending key and @p cfg may be partially updated.
 */
bool load_json(const std::string& text, AppConfig& cfg, std::string& err);

/// Read @p path and apply it with load_json(). A missing file is an error.
bool load_file(const std::string& path, AppConfig& cfg, std::string& err);

bool parse_dialect(const std::string& name, Dialect& out);
bool parse_peer_policy(const std::string& name, PeerPolicy& out);

const char* dialect_name(Dialect d);
const char* peer_policy_name(PeerPolicy p);

} // namespace config
} // namespace pumplink
