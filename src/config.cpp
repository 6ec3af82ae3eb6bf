// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================

#include "bravejig/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace bravejig {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    fs::path base;
    if (xdg && *xdg) {
        base = fs::path(xdg);
    } else {
        const char* home = std::getenv("HOME");
        base = fs::path(home && *home ? home : ".") / ".config";
    }
    return (base / "bravejig" / "config.json").string();
}

// ---------------------------------------------------------------------------
// Positive integer field; absent keys are left alone.
// ---------------------------------------------------------------------------
static bool read_int(const json& j, const char* key, int& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer() || it->get<long long>() <= 0 || it->get<long long>() > 86400000) {
        err = std::string("config_bad_value:") + key;
        return false;
    }
    dst = it->get<int>();
    return true;
}

bool apply_config_json(const json& j, Config& cfg, std::string& err) {
    if (!j.is_object()) { err = "config_parse_error"; return false; }

    Config next = cfg;
    if (auto it = j.find("port"); it != j.end()) {
        if (!it->is_string()) { err = "config_bad_value:port"; return false; }
        next.port = it->get<std::string>();
    }
    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string() || !parse_log_level(it->get<std::string>(), next.log_level)) {
            err = "config_bad_value:log_level";
            return false;
        }
    }
    if (!read_int(j, "baud", next.baud, err)) return false;
    if (!read_int(j, "command_timeout_ms", next.command_timeout_ms, err)) return false;
    if (!read_int(j, "dfu_init_timeout_ms", next.dfu_init_timeout_ms, err)) return false;
    if (!read_int(j, "dfu_chunk_timeout_ms", next.dfu_chunk_timeout_ms, err)) return false;
    if (!read_int(j, "dfu_block_timeout_ms", next.dfu_block_timeout_ms, err)) return false;
    if (!read_int(j, "dfu_settle_ms", next.dfu_settle_ms, err)) return false;
    if (!read_int(j, "uplink_timeout_ms", next.uplink_timeout_ms, err)) return false;
    if (!read_int(j, "worker_threads", next.worker_threads, err)) return false;
    if (next.worker_threads > 64) { err = "config_bad_value:worker_threads"; return false; }

    cfg = next;
    return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream in(path);
    if (!in) { err = "config_open_failed"; return false; }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error&) {
        err = "config_parse_error";
        return false;
    }
    return apply_config_json(j, cfg, err);
}

json config_to_json(const Config& cfg) {
    return json{
        {"port", cfg.port},
        {"baud", cfg.baud},
        {"command_timeout_ms", cfg.command_timeout_ms},
        {"dfu_init_timeout_ms", cfg.dfu_init_timeout_ms},
        {"dfu_chunk_timeout_ms", cfg.dfu_chunk_timeout_ms},
        {"dfu_block_timeout_ms", cfg.dfu_block_timeout_ms},
        {"dfu_settle_ms", cfg.dfu_settle_ms},
        {"uplink_timeout_ms", cfg.uplink_timeout_ms},
        {"worker_threads", cfg.worker_threads},
        {"log_level", to_string(cfg.log_level)}};
}

} // namespace bravejig
