/**
 * @file main.cpp
 * @brief bravejig CLI: one-shot router/module commands and a live monitor.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global link options plus router/module/monitor subcommands.
 *  - Layer configuration: defaults -> JSON config file (nlohmann) -> flags.
 *  - Open one Connection, run exactly one command, print a result line, exit.
 *
 * Output:
 *  - pretty: `status=ok key=value ...` on stdout, `status=error reason=<kind> ...` on stderr.
 *  - json:   one JSON object per line on stdout (errors included).
 *
 * Exit codes: 0 ok, 1 connection, 2 usage/validation, 3 timeout, 4 device, 5 dfu, 6 other.
 */

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "bravejig/codec.hpp"
#include "bravejig/config.hpp"
#include "bravejig/connection.hpp"
#include "bravejig/firmware.hpp"
#include "bravejig/packet_json.hpp"
#include "bravejig/transport/linux_serial.hpp"

using json = nlohmann::json;
using namespace bravejig;

// ---------- small utilities ----------

enum ExitCode : int {
  EXIT_OK = 0, EXIT_CONNECTION = 1, EXIT_USAGE = 2, EXIT_TIMEOUT = 3,
  EXIT_DEVICE = 4, EXIT_DFU = 5, EXIT_OTHER = 6
};

static int exit_code_for(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:         return EXIT_OK;
    case ErrorKind::Connection:
    case ErrorKind::Disconnected: return EXIT_CONNECTION;
    case ErrorKind::Invalid:      return EXIT_USAGE;
    case ErrorKind::Timeout:      return EXIT_TIMEOUT;
    case ErrorKind::Device:       return EXIT_DEVICE;
    case ErrorKind::Dfu:          return EXIT_DFU;
    default:                      return EXIT_OTHER;
  }
}

struct Ansi {
  bool enabled{true};
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

// Accepts "0x"-prefixed or bare hex; at most 16 significant digits.
static bool parse_hex_u64(std::string s, uint64_t& out) {
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s = s.substr(2);
  if (s.empty()) return false;
  for (char c : s) if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  size_t first = s.find_first_not_of('0');
  if (first != std::string::npos && s.size() - first > 16) return false;
  errno = 0;
  out = std::strtoull(s.c_str(), nullptr, 16);
  return errno == 0;
}

static bool parse_hex_u16(const std::string& s, uint16_t& out) {
  uint64_t v = 0;
  if (!parse_hex_u64(s, v) || v > 0xFFFF) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

// "0A0B0C", "0a 0b 0c" or "0x0A0B0C"
static bool parse_hex_bytes(std::string s, Bytes& out) {
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s = s.substr(2);
  std::string digits;
  for (char c : s) {
    if (c == ' ' || c == ':') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    digits.push_back(c);
  }
  if (digits.empty() || digits.size() % 2) return false;
  out.clear();
  for (size_t i = 0; i < digits.size(); i += 2)
    out.push_back(static_cast<uint8_t>(std::strtoul(digits.substr(i, 2).c_str(), nullptr, 16)));
  return true;
}

static std::string quote(const std::string& s) {
  return s.find(' ') == std::string::npos ? s : "\"" + s + "\"";
}

// Flatten a JSON object into key=value pairs for pretty output; status leads.
static std::string kv_line(const json& j) {
  std::string line;
  auto emit = [&line](const std::string& k, const json& v) {
    if (v.is_object()) return;
    if (!line.empty()) line += ' ';
    line += k + "=";
    line += v.is_string() ? quote(v.get<std::string>()) : v.dump();
  };
  if (j.contains("status")) emit("status", j["status"]);
  for (auto it = j.begin(); it != j.end(); ++it)
    if (it.key() != "status") emit(it.key(), it.value());
  return line;
}

struct Printer {
  bool as_json{false};
  Ansi ansi;
  std::mutex mutex;

  void line(const json& j, bool ok) {
    std::lock_guard<std::mutex> lk(mutex);
    if (as_json) { (ok ? std::cout : std::cerr) << j.dump() << "\n"; return; }
    std::string s = kv_line(j);
    if (ok) std::cout << s << "\n";
    else    std::cerr << ansi.red(s) << "\n";
  }

  void frame_line(const std::string& pretty, const json& j) {
    std::lock_guard<std::mutex> lk(mutex);
    if (as_json) std::cout << j.dump() << std::endl;
    else         std::cout << pretty << std::endl;
  }

  // Result of a command; extra holds command-specific fields.
  int result(const std::string& cmd, const CommandResult& r, json extra = json::object()) {
    json j{{"status", r.success ? "ok" : "error"}, {"cmd", cmd}};
    if (!r.success) j["reason"] = to_string(r.kind);
    if (!r.message.empty()) j["message"] = r.message;
    for (auto it = extra.begin(); it != extra.end(); ++it) j[it.key()] = it.value();
    if (as_json && r.response) j["response"] = to_json(*r.response);
    line(j, r.success);
    if (!as_json && r.success && r.response) {
      std::lock_guard<std::mutex> lk(mutex);
      std::cout << "  " << describe(*r.response) << "\n";
    }
    return exit_code_for(r.kind);
  }

  void progress(std::size_t cur, std::size_t total, const std::string& phase) {
    std::lock_guard<std::mutex> lk(mutex);
    if (as_json)
      std::cout << json{{"progress", {{"current", cur}, {"total", total}, {"phase", phase}}}}.dump() << std::endl;
    else
      std::cout << "progress current=" << cur << " total=" << total << " phase=" << quote(phase) << std::endl;
  }

  int usage(const std::string& reason) {
    line(json{{"status", "error"}, {"reason", reason}}, false);
    return EXIT_USAGE;
  }
};

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop = true; }

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config, opt_port, opt_format = "pretty", opt_log_level;
  int opt_baud = 0, opt_timeout_ms = 0;
  bool opt_no_color = false;

  CLI::App app{"bravejig: BraveJIG router and sensor module control"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/bravejig/config.json)");
  app.add_option("-p,--port", opt_port, "Serial port path, e.g. /dev/ttyACM0");
  app.add_option("-b,--baud", opt_baud, "Baud rate (default 38400)");
  app.add_option("--timeout-ms", opt_timeout_ms, "Command timeout in ms (default 10000)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
  app.add_option("--format", opt_format, "pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  // ---- router ----
  auto* router = app.add_subcommand("router", "Router (JIG Info) commands");
  router->require_subcommand(1);
  auto* r_start   = router->add_subcommand("start", "Start the router");
  auto* r_stop    = router->add_subcommand("stop", "Stop the router");
  auto* r_version = router->add_subcommand("get-version", "Read firmware version");
  auto* r_keep    = router->add_subcommand("keep-alive", "Send keep-alive");
  auto* r_getscan = router->add_subcommand("get-scan-mode", "Read scan mode");
  auto* r_setscan = router->add_subcommand("set-scan-mode", "Set scan mode");
  int scan_mode = -1;
  r_setscan->add_option("--mode", scan_mode, "0=Long Range, 1=Legacy")->required();
  auto* r_getid = router->add_subcommand("get-device-id", "Read registered device IDs");
  int get_index = -1;
  auto* get_index_opt = r_getid->add_option("--index", get_index, "Table index 0-99 (omit for all)");
  auto* r_rmid = router->add_subcommand("remove-device-id", "Remove registered device IDs");
  int rm_index = -1;
  auto* rm_index_opt = r_rmid->add_option("--index", rm_index, "Table index 0-99 (omit for all)");
  auto* r_dfu = router->add_subcommand("dfu", "Update router firmware");
  std::string router_fw;
  r_dfu->add_option("--file", router_fw, "Firmware image")->required();

  // ---- module ----
  auto* module = app.add_subcommand("module", "Sensor module (Downlink) commands");
  module->require_subcommand(1);
  std::string module_id, sensor_id_s, data_hex, sensor_fw;

  auto* m_uplink = module->add_subcommand("instant-uplink", "Request an immediate uplink");
  m_uplink->add_option("--module-id", module_id, "Device ID (hex)")->required();
  auto* uplink_sensor_opt = m_uplink->add_option("--sensor-id", sensor_id_s, "Sensor ID (hex), default any");

  auto* m_getp = module->add_subcommand("get-parameter", "Read module parameters");
  m_getp->add_option("--module-id", module_id, "Device ID (hex)")->required();

  auto* m_setp = module->add_subcommand("set-parameter", "Write module parameters");
  m_setp->add_option("--module-id", module_id, "Device ID (hex)")->required();
  m_setp->add_option("--sensor-id", sensor_id_s, "Sensor ID (hex)")->required();
  m_setp->add_option("--data", data_hex, "Parameter blob (hex)")->required();

  auto* m_restart = module->add_subcommand("restart", "Restart the module");
  m_restart->add_option("--module-id", module_id, "Device ID (hex)")->required();

  auto* m_dfu = module->add_subcommand("sensor-dfu", "Update sensor firmware");
  m_dfu->add_option("--module-id", module_id, "Device ID (hex)")->required();
  m_dfu->add_option("--sensor-id", sensor_id_s, "Sensor ID (hex)")->required();
  m_dfu->add_option("--file", sensor_fw, "Firmware image")->required();

  // ---- monitor ----
  auto* monitor = app.add_subcommand("monitor", "Print every inbound frame until Ctrl-C");

  CLI11_PARSE(app, argc, argv);

  Printer out;
  out.as_json = opt_format == "json";
  out.ansi.enabled = !opt_no_color && ::isatty(fileno(stderr));

  // ---- configuration: defaults -> file -> flags ----
  Config cfg;
  std::string err;
  if (!load_config_file(opt_config.empty() ? default_config_path() : opt_config, cfg, err))
    return out.usage(err);
  if (!opt_port.empty()) cfg.port = opt_port;
  if (opt_baud > 0) cfg.baud = opt_baud;
  if (opt_timeout_ms > 0) cfg.command_timeout_ms = opt_timeout_ms;
  if (!opt_log_level.empty()) parse_log_level(opt_log_level, cfg.log_level);
  if (cfg.port.empty()) return out.usage("no_port");

  // ---- argument validation before touching the port ----
  uint64_t device_id = 0;
  uint16_t sensor_id = 0;
  if (module->parsed()) {
    if (!parse_hex_u64(module_id, device_id)) return out.usage("bad_module_id");
    if (!sensor_id_s.empty() && !parse_hex_u16(sensor_id_s, sensor_id)) return out.usage("bad_sensor_id");
  }
  Bytes blob;
  if (m_setp->parsed() && !parse_hex_bytes(data_hex, blob)) return out.usage("bad_data_hex");
  ScanMode mode = ScanMode::LongRange;
  if (r_setscan->parsed() && !scan_mode_from_int(scan_mode, mode)) return out.usage("bad_scan_mode");
  if (r_dfu->parsed() && cfg.baud != DFU_REQUIRED_BAUD) return out.usage("dfu_requires_38400_baud");

  FirmwareSource fw;
  if (r_dfu->parsed() && !FirmwareSource::load(router_fw, ROUTER_FIRMWARE_MAX, fw, err)) return out.usage(err);
  if (m_dfu->parsed() && !FirmwareSource::load(sensor_fw, SENSOR_FIRMWARE_MAX + 4, fw, err)) return out.usage(err);

  // ---- connect ----
  Connection conn(cfg, std::make_unique<transport::LinuxSerialPort>(), std::cerr);
  if (!conn.open(err)) {
    out.line(json{{"status", "error"}, {"reason", "connection"}, {"message", err}, {"port", cfg.port}}, false);
    return EXIT_CONNECTION;
  }

  auto progress = [&out](std::size_t cur, std::size_t total, const std::string& phase) {
    out.progress(cur, total, phase);
  };

  auto dfu_result = [&out, &conn](const std::string& cmd, const DfuReport& rep) {
    json j = to_json(rep);
    j["cmd"] = cmd;
    j.erase("dfu_errors");
    if (!rep.success) j["reason"] = to_string(rep.kind);
    out.line(j, rep.success);
    for (const auto& e : rep.dfu_errors)
      out.line(json{{"dfu_error", e.type_name}, {"reason", e.reason_code}, {"reason_text", e.reason_text},
                    {"context", e.context}}, false);
    if (!rep.success) {
      ErrorSummary s = conn.errors().summary();
      out.line(json{{"error_summary", "router"}, {"total_errors", s.total_errors},
                    {"dfu_errors", s.dfu_errors}}, false);
    }
    return rep.success ? EXIT_OK : EXIT_DFU;
  };

  int rc = EXIT_OTHER;

  // ---- router ----
  if (r_start->parsed())        rc = out.result("router.start", conn.router().start());
  else if (r_stop->parsed())    rc = out.result("router.stop", conn.router().stop());
  else if (r_keep->parsed())    rc = out.result("router.keep-alive", conn.router().keep_alive());
  else if (r_version->parsed()) {
    RouterVersion v;
    CommandResult r = conn.router().get_version(v);
    rc = out.result("router.get-version", r, r.success ? json{{"version", v.to_string()}} : json::object());
  } else if (r_getscan->parsed()) {
    ScanMode m = ScanMode::LongRange;
    CommandResult r = conn.router().get_scan_mode(m);
    rc = out.result("router.get-scan-mode", r,
                    r.success ? json{{"scan_mode", to_string(m)}, {"value", static_cast<int>(m)}} : json::object());
  } else if (r_setscan->parsed()) {
    rc = out.result("router.set-scan-mode", conn.router().set_scan_mode(mode));
  } else if (r_getid->parsed()) {
    if (get_index_opt->count()) {
      DeviceIdEntry e;
      CommandResult r = conn.router().get_device_id(get_index, e);
      char id[20];
      std::snprintf(id, sizeof(id), "%016llX", static_cast<unsigned long long>(e.device_id));
      rc = out.result("router.get-device-id", r,
                      r.success ? json{{"index", e.index}, {"device_id", id}} : json::object());
    } else {
      std::vector<uint64_t> ids;
      CommandResult r = conn.router().get_device_id_all(ids);
      json list = json::array();
      for (uint64_t d : ids) {
        char id[20];
        std::snprintf(id, sizeof(id), "%016llX", static_cast<unsigned long long>(d));
        list.push_back(id);
      }
      rc = out.result("router.get-device-id", r, r.success ? json{{"device_ids", list}} : json::object());
    }
  } else if (r_rmid->parsed()) {
    rc = rm_index_opt->count() ? out.result("router.remove-device-id", conn.router().remove_device_id(rm_index))
                               : out.result("router.remove-device-id", conn.router().remove_device_id_all());
  } else if (r_dfu->parsed()) {
    rc = dfu_result("router.dfu", conn.router_dfu().run(fw, progress));
  }

  // ---- module ----
  else if (m_uplink->parsed()) {
    std::optional<uint16_t> sensor;
    if (uplink_sensor_opt->count()) sensor = sensor_id;
    rc = out.result("module.instant-uplink", conn.modules().instant_uplink(device_id, sensor));
  } else if (m_getp->parsed()) {
    Bytes params;
    CommandResult r = conn.modules().get_parameter(device_id, params);
    rc = out.result("module.get-parameter", r,
                    r.success ? json{{"parameters_hex", to_hex(params)}} : json::object());
  } else if (m_setp->parsed()) {
    rc = out.result("module.set-parameter", conn.modules().set_parameter(device_id, sensor_id, blob));
  } else if (m_restart->parsed()) {
    rc = out.result("module.restart", conn.modules().device_restart(device_id));
  } else if (m_dfu->parsed()) {
    rc = dfu_result("module.sensor-dfu", conn.sensor_dfu().run(device_id, sensor_id, fw, progress));
  }

  // ---- monitor ----
  else if (monitor->parsed()) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);
    conn.dispatcher().set_frame_observer([&out](const Frame& f) {
      out.frame_line(describe(f), to_json(f));
    });
    conn.dispatcher().set_drop_observer([&out](const Bytes& raw, DecodeError e) {
      out.line(json{{"status", "drop"}, {"reason", to_string(e)}, {"len", raw.size()},
                    {"hex", to_hex(raw)}}, true);
    });
    out.line(json{{"status", "monitoring"}, {"port", cfg.port}, {"baud", cfg.baud}}, true);
    while (!g_stop && conn.is_open())
      std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto ts = conn.transport().statistics();
    auto ds = conn.dispatcher().stats();
    const bool lost = !g_stop && conn.transport().link_lost();
    out.line(json{{"status", lost ? "error" : "stopped"}, {"reason", lost ? "disconnected" : "signal"},
                  {"bytes_received", ts.bytes_received}, {"frames", ds.frames},
                  {"dropped", ds.dropped}, {"uplinks", ds.uplinks}, {"errors", ds.errors}}, !lost);
    rc = lost ? EXIT_CONNECTION : EXIT_OK;
  }

  conn.close();
  return rc;
}
