// ============================================================================
// config.cpp: JSON settings loader
// ============================================================================

#include "pumplink/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"

namespace pumplink {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    fs::path base;
    if (xdg && *xdg) {
        base = fs::path(xdg);
    } else {
        const char* home = std::getenv("HOME");
        base = fs::path(home ? home : ".") / ".config";
    }
    return (base / "pumplink" / "config.json").string();
}

bool parse_dialect(const std::string& name, Dialect& out) {
    if (name == "split")     { out = Dialect::Split;     return true; }
    if (name == "symmetric") { out = Dialect::Symmetric; return true; }
    return false;
}

bool parse_peer_policy(const std::string& name, PeerPolicy& out) {
    if (name == "trust") { out = PeerPolicy::TrustConfigured;  return true; }
    if (name == "adopt") { out = PeerPolicy::AdoptFirstSender; return true; }
    return false;
}

const char* dialect_name(Dialect d) {
    return d == Dialect::Symmetric ? "symmetric" : "split";
}

const char* peer_policy_name(PeerPolicy p) {
    return p == PeerPolicy::AdoptFirstSender ? "adopt" : "trust";
}

// -------- typed field readers --------

static bool get_string(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { err = std::string(key) + ": expected a string"; return false; }
    out = it->get<std::string>();
    return true;
}

static bool get_u16(const json& j, const char* key, uint16_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_unsigned() || it->get<uint64_t>() > 0xFFFF) {
        err = std::string(key) + ": expected an integer 0..65535";
        return false;
    }
    out = static_cast<uint16_t>(it->get<uint64_t>());
    return true;
}

static bool get_ms(const json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_unsigned() ||
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        err = std::string(key) + ": expected a non-negative integer (ms)";
        return false;
    }
    out = static_cast<int>(it->get<uint64_t>());
    return true;
}

bool load_json(const std::string& text, AppConfig& cfg, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) { err = "top level must be an object"; return false; }

    ConnectionConfig& c = cfg.connection;
    if (!get_string(j, "host", c.host, err))           return false;
    if (!get_string(j, "bind_host", c.bind_host, err)) return false;
    if (!get_u16(j, "port_listen", c.port_listen, err)) return false;

    std::string name;
    if (j.contains("dialect")) {
        if (!get_string(j, "dialect", name, err)) return false;
        Dialect d;
        if (!parse_dialect(name, d)) { err = "dialect: expected split|symmetric"; return false; }
        apply_dialect(c, d);
    }
    if (!get_u16(j, "port_read", c.port_read, err))   return false;
    if (!get_u16(j, "port_write", c.port_write, err)) return false;

    if (j.contains("peer_policy")) {
        if (!get_string(j, "peer_policy", name, err)) return false;
        if (!parse_peer_policy(name, c.peer_policy)) {
            err = "peer_policy: expected trust|adopt";
            return false;
        }
    }

    if (j.contains("log_level")) {
        if (!get_string(j, "log_level", name, err)) return false;
        if (!log::parse_level(name, cfg.log_level)) {
            err = "log_level: expected debug|info|warn|error|off";
            return false;
        }
    }

    if (!get_ms(j, "timeout_ms", cfg.timeout_ms, err))   return false;
    if (!get_ms(j, "interval_ms", cfg.interval_ms, err)) return false;

    auto regs = j.find("registers");
    if (regs != j.end()) {
        if (!regs->is_array()) { err = "registers: expected an array"; return false; }
        std::vector<uint16_t> out;
        for (const auto& r : *regs) {
            if (!r.is_number_unsigned() || r.get<uint64_t>() > 0xFFFF) {
                err = "registers: expected integers 0..65535";
                return false;
            }
            out.push_back(static_cast<uint16_t>(r.get<uint64_t>()));
        }
        cfg.registers = std::move(out);
    }
    return true;
}

bool load_file(const std::string& path, AppConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "cannot open " + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!load_json(ss.str(), cfg, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

} // namespace config
} // namespace pumplink
