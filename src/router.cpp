// ============================================================================
// router.cpp — implementation for router.hpp
// ============================================================================

#include "bravejig/router.hpp"
#include "bravejig/byte_order.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/command_engine.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/logger.hpp"

#include <cstdio>

namespace bravejig {

std::string RouterVersion::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(build);
}

const char* to_string(ScanMode m) {
    return m == ScanMode::LongRange ? "long_range" : "legacy";
}

bool scan_mode_from_int(int v, ScanMode& out) {
    if (v == 0) { out = ScanMode::LongRange; return true; }
    if (v == 1) { out = ScanMode::Legacy;    return true; }
    return false;
}

// ============================================================================
// Payload interpreters
// ============================================================================

bool parse_success_byte(const Bytes& payload, bool& success) {
    if (payload.empty()) return false;
    success = payload[0] == JIG_ACK_SUCCESS;
    return true;
}

bool parse_version(const Bytes& payload, RouterVersion& out) {
    if (payload.size() < 3) return false;
    out.major = payload[0];
    out.minor = payload[1];
    out.build = payload[2];
    return true;
}

bool parse_device_id(const Bytes& payload, DeviceIdEntry& out) {
    if (payload.size() < 9) return false;
    out.index = payload[0];
    out.device_id = get_u64(&payload[1]);
    return true;
}

bool parse_device_id_all(const Bytes& payload, std::vector<uint64_t>& out) {
    if (payload.empty()) return false;
    const std::size_t count = payload[0];
    if (payload.size() < 1 + 8 * count) return false;
    out.clear();
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) out.push_back(get_u64(&payload[1 + 8 * i]));
    return true;
}

bool parse_scan_mode(const Bytes& payload, ScanMode& out) {
    if (payload.empty()) return false;
    return scan_mode_from_int(payload[0], out);
}

// ============================================================================
// RouterCommands
// ============================================================================

RouterCommands::RouterCommands(CommandEngine& engine, Logger& log, std::chrono::milliseconds timeout)
    : engine_(engine), log_(log), timeout_(timeout) {}

// ---------------------------------------------------------------------------
// query()
// -------
// Encode, execute under jig_info_<cmd>, and make sure what came back really
// is a JIG-Info response for that command.
// ---------------------------------------------------------------------------
CommandResult RouterCommands::query(uint8_t cmd) {
    const std::string name = jig_info_command_name(cmd);
    log_.info("router", "command", "cmd=" + name);

    CommandResult r = engine_.execute(encode_jig_info_request(cmd, unix_now()), jig_info_key(cmd), timeout_);
    if (!r.success) return r;

    const auto* j = r.response ? std::get_if<JigInfoResponse>(&*r.response) : nullptr;
    if (!j || j->cmd != cmd)
        return CommandResult::fail(ErrorKind::Protocol, "unexpected response to " + name);
    r.message = name;
    return r;
}

// Commands whose whole answer is one success byte.
CommandResult RouterCommands::acknowledged(uint8_t cmd) {
    CommandResult r = query(cmd);
    if (!r.success) return r;

    const auto& j = std::get<JigInfoResponse>(*r.response);
    bool ok = false;
    if (!parse_success_byte(j.payload, ok))
        return CommandResult::fail(ErrorKind::Protocol, "empty payload for " + r.message);
    if (!ok) {
        char code[8];
        std::snprintf(code, sizeof(code), "0x%02X", j.payload[0]);
        CommandResult f = CommandResult::fail(ErrorKind::Device, r.message + " rejected by router (" + code + ")");
        f.response = r.response;
        return f;
    }
    return r;
}

CommandResult RouterCommands::start()      { return acknowledged(JIG_ROUTER_START); }
CommandResult RouterCommands::stop()       { return acknowledged(JIG_ROUTER_STOP); }
CommandResult RouterCommands::keep_alive() { return acknowledged(JIG_KEEP_ALIVE); }
CommandResult RouterCommands::remove_device_id_all() { return acknowledged(JIG_REMOVE_DEVICE_ID_ALL); }

CommandResult RouterCommands::get_version(RouterVersion& out) {
    CommandResult r = query(JIG_GET_VERSION);
    if (!r.success) return r;
    if (!parse_version(std::get<JigInfoResponse>(*r.response).payload, out))
        return CommandResult::fail(ErrorKind::Protocol, "short version payload");
    r.message = "version=" + out.to_string();
    return r;
}

CommandResult RouterCommands::get_device_id(int index, DeviceIdEntry& out) {
    if (index < 0 || index > MAX_DEVICE_INDEX)
        return CommandResult::fail(ErrorKind::Invalid, "bad_index: " + std::to_string(index) + " (0-99)");
    CommandResult r = query(static_cast<uint8_t>(JIG_GET_DEVICE_ID_BASE + index));
    if (!r.success) return r;
    if (!parse_device_id(std::get<JigInfoResponse>(*r.response).payload, out))
        return CommandResult::fail(ErrorKind::Protocol, "short device id payload");
    return r;
}

CommandResult RouterCommands::get_device_id_all(std::vector<uint64_t>& out) {
    CommandResult r = query(JIG_GET_DEVICE_ID_ALL);
    if (!r.success) return r;
    if (!parse_device_id_all(std::get<JigInfoResponse>(*r.response).payload, out))
        return CommandResult::fail(ErrorKind::Protocol, "short device list payload");
    r.message = "count=" + std::to_string(out.size());
    return r;
}

CommandResult RouterCommands::get_scan_mode(ScanMode& out) {
    CommandResult r = query(JIG_GET_SCAN_MODE);
    if (!r.success) return r;
    if (!parse_scan_mode(std::get<JigInfoResponse>(*r.response).payload, out))
        return CommandResult::fail(ErrorKind::Protocol, "bad scan mode payload");
    r.message = std::string("scan_mode=") + to_string(out);
    return r;
}

CommandResult RouterCommands::set_scan_mode(ScanMode mode) {
    return acknowledged(mode == ScanMode::LongRange ? JIG_SET_SCAN_MODE_LONG_RANGE
                                                    : JIG_SET_SCAN_MODE_LEGACY);
}

CommandResult RouterCommands::remove_device_id(int index) {
    if (index < 0 || index > MAX_DEVICE_INDEX)
        return CommandResult::fail(ErrorKind::Invalid, "bad_index: " + std::to_string(index) + " (0-99)");
    return acknowledged(static_cast<uint8_t>(JIG_REMOVE_DEVICE_ID_BASE + index));
}

} // namespace bravejig
