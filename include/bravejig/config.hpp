#pragma once
/**
 * @file config.hpp
 * @brief Host-side settings: built-in defaults, then a JSON file, then CLI flags.
 *
 * File location: $XDG_CONFIG_HOME/bravejig/config.json, falling back to
 * ~/.config/bravejig/config.json. A missing file is fine; a malformed one
 * is an error (config_parse_error, or config_bad_value:<key>).
 *
 * @code{.json}
 *   { "port": "/dev/ttyACM0", "baud": 38400, "command_timeout_ms": 10000,
 *     "log_level": "info", "worker_threads": 4 }
 * @endcode
 */

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

#include "bravejig/logger.hpp"

namespace bravejig {

/// Router DFU only works at this rate.
constexpr int DFU_REQUIRED_BAUD = 38400;

struct Config {
    std::string port;
    int baud{38400};
    int command_timeout_ms{10000};
    int dfu_init_timeout_ms{10000};
    int dfu_chunk_timeout_ms{10000};
    int dfu_block_timeout_ms{10000};
    int dfu_settle_ms{2000};
    int uplink_timeout_ms{30000};
    int worker_threads{4};
    LogLevel log_level{LogLevel::Info};
};

/// $XDG_CONFIG_HOME/bravejig/config.json or ~/.config/bravejig/config.json
std::string default_config_path();

/// Overlay keys present in j onto cfg. Unknown keys are ignored.
bool apply_config_json(const nlohmann::json& j, Config& cfg, std::string& err);

/// Read path and overlay it. A missing file leaves cfg untouched and returns true.
bool load_config_file(const std::string& path, Config& cfg, std::string& err);

nlohmann::json config_to_json(const Config& cfg);

} // namespace bravejig
