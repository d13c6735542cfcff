/**
 * @file main.cpp
 * @brief pumplink-cli: talk to a heat pump's serial-over-UDP gateway from the shell.
 *
 * Subcommands:
 *  - monitor  : print every inbound message and poll a register list until Ctrl-C.
 *  - read     : one register read; prints "<reg>: <value>".
 *  - write    : one register write.
 *  - listen   : print every inbound message until Ctrl-C.
 *  - decode   : parse a hex frame offline.
 *
 * Settings come from the JSON config file (see pumplink/config.hpp); options given on the
 * command line win. Failures are reported as "status=error reason=<token>" on stderr.
 *
 * Exit codes:
 *  - 0 success
 *  - 1 socket / send failure
 *  - 2 bad input (options, hex, config, undecodable frame)
 *  - 3 no response in time
 *  - 4 request cancelled
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "pumplink/config.hpp"
#include "pumplink/connection.hpp"
#include "pumplink/controller.hpp"
#include "pumplink/hex.hpp"
#include "pumplink/log.hpp"
#include "pumplink/parser.hpp"
#include "pumplink/transport/transport_linux_udp.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace pumplink;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_signal(int) { g_interrupted = 1; }

static std::mutex g_out_mutex;

static void emit(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_out_mutex);
  std::cout << line << std::endl;
}

static std::string render(const Message& msg, const std::string& format) {
  if (format == "json") return parser::to_json(msg);
  if (format == "raw")  return to_hex(msg.to_bytes());
  return parser::describe(msg);
}

static std::string render_value(uint16_t reg, uint32_t value, const std::string& format) {
  if (format == "json") {
    json j;
    j["register"] = reg;
    j["value"] = value;
    return j.dump();
  }
  if (format == "raw") return std::to_string(value);
  return std::to_string(reg) + ": " + std::to_string(value);
}

static int exit_code_for(RequestStatus s) {
  switch (s) {
    case RequestStatus::Ok:         return 0;
    case RequestStatus::Timeout:    return 3;
    case RequestStatus::Cancelled:  return 4;
    case RequestStatus::SendFailed:
    case RequestStatus::NotOpen:    return 1;
  }
  return 1;
}

// Sleep up to @p ms, returning early on SIGINT.
static void interruptible_sleep(int ms) {
  using namespace std::chrono;
  const auto until = steady_clock::now() + milliseconds(ms);
  while (!g_interrupted && steady_clock::now() < until) {
    std::this_thread::sleep_for(milliseconds(50));
  }
}

int main(int argc, char** argv) {
  // ---- global options ----
  std::string opt_config;
  std::string opt_host;
  uint16_t    opt_port_listen = 0, opt_port_read = 0, opt_port_write = 0;
  std::string opt_dialect, opt_peer_policy, opt_log_level;
  std::string opt_format = "pretty";

  CLI::App app{"pumplink: heat pump serial-over-UDP client"};
  app.require_subcommand(1);

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/pumplink/config.json)");
  auto* o_host   = app.add_option("--host", opt_host, "Heat pump address");
  auto* o_listen = app.add_option("--port-listen", opt_port_listen, "Local UDP port to bind");
  auto* o_read   = app.add_option("--port-read", opt_port_read, "Remote port for read requests");
  auto* o_write  = app.add_option("--port-write", opt_port_write, "Remote port for write requests");
  auto* o_dialect = app.add_option("--dialect", opt_dialect, "Port layout: split|symmetric")
                        ->check(CLI::IsMember({"split", "symmetric"}));
  auto* o_policy = app.add_option("--peer-policy", opt_peer_policy, "Peer of record: trust|adopt")
                       ->check(CLI::IsMember({"trust", "adopt"}));
  auto* o_level  = app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
                       ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
      ->check(CLI::IsMember({"pretty", "json", "raw"}));

  // ---- monitor ----
  std::vector<uint16_t> mon_registers;
  int mon_interval_ms = 0, mon_timeout_ms = 0;
  auto* sub_monitor = app.add_subcommand("monitor", "Print inbound traffic and poll registers");
  auto* o_mon_regs  = sub_monitor->add_option("--registers", mon_registers, "Registers to poll");
  auto* o_mon_int   = sub_monitor->add_option("--interval-ms", mon_interval_ms, "Delay between polling rounds");
  auto* o_mon_to    = sub_monitor->add_option("--timeout-ms", mon_timeout_ms, "Per-read timeout");

  // ---- read ----
  uint16_t read_reg = 0;
  int read_timeout_ms = 0;
  auto* sub_read = app.add_subcommand("read", "Read one register");
  sub_read->add_option("register", read_reg, "Register number")->required();
  auto* o_read_to = sub_read->add_option("--timeout-ms", read_timeout_ms, "Response timeout");

  // ---- write ----
  uint16_t write_reg = 0;
  uint32_t write_value = 0;
  int write_timeout_ms = 0;
  auto* sub_write = app.add_subcommand("write", "Write one register");
  sub_write->add_option("register", write_reg, "Register number")->required();
  sub_write->add_option("value", write_value, "Value (32-bit)")->required();
  auto* o_write_to = sub_write->add_option("--timeout-ms", write_timeout_ms, "Response timeout");

  // ---- listen ----
  auto* sub_listen = app.add_subcommand("listen", "Print every inbound message");

  // ---- decode ----
  std::vector<std::string> decode_hex;
  auto* sub_decode = app.add_subcommand("decode", "Parse a hex frame offline");
  sub_decode->add_option("hex", decode_hex, "Frame bytes, e.g. 5C 00 20 69 00 49")->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // -------- decode needs no settings or socket --------
  if (sub_decode->parsed()) {
    std::string text;
    for (const auto& part : decode_hex) { text += part; text += ' '; }
    std::vector<uint8_t> bytes;
    if (!from_hex(text, bytes)) {
      std::cerr << "status=error reason=bad_hex\n";
      return 2;
    }
    ParseResult pr = parser::parse(bytes);
    if (!pr.ok()) {
      std::cerr << "status=error reason=" << parse_status_name(pr.status)
                << " detail=\"" << pr.detail << "\"\n";
      return 2;
    }
    std::cout << render(pr.message, opt_format) << "\n";
    return 0;
  }

  // -------- resolve settings: file, then command line --------
  AppConfig cfg;
  {
    std::string err;
    if (!opt_config.empty()) {
      if (!config::load_file(opt_config, cfg, err)) {
        std::cerr << "status=error reason=config detail=\"" << err << "\"\n";
        return 2;
      }
    } else {
      const std::string path = config::default_config_path();
      std::error_code ec;
      if (fs::exists(path, ec) && !config::load_file(path, cfg, err)) {
        std::cerr << "status=error reason=config detail=\"" << err << "\"\n";
        return 2;
      }
    }
  }

  ConnectionConfig& cc = cfg.connection;
  if (o_host->count())    cc.host = opt_host;
  if (o_listen->count())  cc.port_listen = opt_port_listen;
  if (o_dialect->count()) {
    Dialect d = Dialect::Split;
    config::parse_dialect(opt_dialect, d);
    apply_dialect(cc, d);
  }
  if (o_read->count())    cc.port_read = opt_port_read;
  if (o_write->count())   cc.port_write = opt_port_write;
  if (o_policy->count())  config::parse_peer_policy(opt_peer_policy, cc.peer_policy);
  if (o_level->count())   log::parse_level(opt_log_level, cfg.log_level);
  if (o_mon_regs->count()) cfg.registers = mon_registers;
  if (o_mon_int->count())  cfg.interval_ms = mon_interval_ms;
  if (o_mon_to->count())   cfg.timeout_ms = mon_timeout_ms;
  if (o_read_to->count())  cfg.timeout_ms = read_timeout_ms;
  if (o_write_to->count()) cfg.timeout_ms = write_timeout_ms;

  log::set_level(cfg.log_level);

  const bool needs_peer = sub_monitor->parsed() || sub_read->parsed() || sub_write->parsed();
  if (needs_peer && cc.host.empty()) {
    std::cerr << "status=error reason=missing_host\n";
    return 2;
  }
  if (sub_monitor->parsed() && cfg.registers.empty()) {
    std::cerr << "status=error reason=no_registers\n";
    return 2;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  // -------- open the session --------
  transport::LinuxUdp udp;
  Connection conn(udp, cc);
  if (!conn.open()) {
    std::cerr << "status=error reason=bind_failed port=" << cc.port_listen << "\n";
    return 1;
  }
  Controller ctl(conn);

  if (sub_read->parsed()) {
    uint32_t value = 0;
    const RequestStatus s = ctl.read(read_reg, value, cfg.timeout_ms);
    if (s != RequestStatus::Ok) {
      std::cerr << "status=error reason=" << request_status_name(s) << " reg=" << read_reg << "\n";
      return exit_code_for(s);
    }
    emit(render_value(read_reg, value, opt_format));
    return 0;
  }

  if (sub_write->parsed()) {
    const RequestStatus s = ctl.write(write_reg, write_value, cfg.timeout_ms);
    if (s != RequestStatus::Ok) {
      std::cerr << "status=error reason=" << request_status_name(s) << " reg=" << write_reg << "\n";
      return exit_code_for(s);
    }
    emit("status=ok reg=" + std::to_string(write_reg) + " value=" + std::to_string(write_value));
    return 0;
  }

  if (sub_listen->parsed()) {
    while (!g_interrupted) {
      Message msg;
      const RxStatus s = ctl.pump(msg, Controller::PUMP_SLICE_MS);
      if (s == RxStatus::Message) {
        emit(render(msg, opt_format));
      } else if (s == RxStatus::Closed || s == RxStatus::Error) {
        std::cerr << "status=error reason=" << rx_status_name(s) << "\n";
        return 1;
      }
    }
    return 0;
  }

  // -------- monitor --------
  ctl.start([&opt_format](const Message& msg) { emit(render(msg, opt_format)); });

  while (!g_interrupted) {
    for (uint16_t reg : cfg.registers) {
      if (g_interrupted) break;
      uint32_t value = 0;
      const RequestStatus s = ctl.read(reg, value, cfg.timeout_ms);
      if (s == RequestStatus::Ok) {
        emit(render_value(reg, value, opt_format));
      } else if (s == RequestStatus::Timeout) {
        emit(std::to_string(reg) + ": TIMEOUT");
      } else {
        std::cerr << "status=error reason=" << request_status_name(s) << " reg=" << reg << "\n";
        if (s != RequestStatus::Cancelled) interruptible_sleep(cfg.interval_ms);
      }
    }
    interruptible_sleep(cfg.interval_ms);
  }

  ctl.stop();
  const Connection::Stats st = conn.stats();
  PUMPLINK_LOG_INFO("msg=\"monitor done\" datagrams=" << st.datagrams << " messages=" << st.messages
                    << " parse_errors=" << st.parse_errors << " foreign_host=" << st.foreign_host
                    << " sent=" << st.frames_sent << " send_failures=" << st.send_failures);
  return 0;
}
