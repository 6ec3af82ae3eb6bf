// ============================================================================
// packet_json.cpp — implementation for packet_json.hpp
// ============================================================================

#include "bravejig/packet_json.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/dfu.hpp"
#include "bravejig/result.hpp"

#include <cstdio>   // std::snprintf

namespace bravejig {

using json = nlohmann::json;

namespace {

std::string hex_field(uint64_t v, int digits) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%0*llX", digits, static_cast<unsigned long long>(v));
    return buf;
}

struct JsonVisitor {
    json operator()(const UplinkNotification& u) const {
        return json{
            {"kind", "uplink"},
            {"parameter_info", u.is_parameter_info()},
            {"data_length", u.data_length},
            {"unix_time", u.unix_time},
            {"device_id", hex_field(u.device_id, 16)},
            {"sensor_id", "0x" + hex_field(u.sensor_id, 4)},
            {"rssi", u.rssi},
            {"order", u.order},
            {"payload_hex", to_hex(u.payload)},
            {"payload_len", u.payload.size()}};
    }
    json operator()(const JigInfoResponse& j) const {
        return json{
            {"kind", "jig_info"},
            {"cmd", j.cmd},
            {"cmd_name", jig_info_command_name(j.cmd)},
            {"router_id", hex_field(j.router_id, 16)},
            {"unix_time", j.unix_time},
            {"payload_hex", to_hex(j.payload)}};
    }
    json operator()(const DownlinkResponse& d) const {
        json j{
            {"kind", "downlink"},
            {"form", d.form == DownlinkForm::Full ? "full" : "compact"},
            {"unix_time", d.unix_time},
            {"device_id", hex_field(d.device_id, 16)},
            {"sensor_id", "0x" + hex_field(d.sensor_id, 4)},
            {"result", d.result},
            {"result_text", downlink_result_text(d.result)}};
        if (d.form == DownlinkForm::Full) {
            j["cmd"] = d.cmd;
            j["order"] = d.order;
        }
        return j;
    }
    json operator()(const DfuResponse& r) const {
        return json{
            {"kind", "dfu"},
            {"unix_time", r.unix_time},
            {"result", r.result},
            {"ready", r.result == DFU_RESULT_READY}};
    }
    json operator()(const ErrorNotification& e) const {
        return json{
            {"kind", "error"},
            {"type", e.type},
            {"type_name", error_type_name(e.type)},
            {"unix_time", e.unix_time},
            {"reason", e.reason},
            {"reason_text", interpret_error_reason(e.reason)}};
    }
};

} // namespace

json to_json(const Frame& f) {
    return std::visit(JsonVisitor{}, f);
}

json to_json(const CommandResult& r) {
    json j{
        {"status", r.success ? "ok" : "error"},
        {"error_kind", to_string(r.kind)},
        {"message", r.message}};
    if (r.response) j["response"] = to_json(*r.response);
    return j;
}

json to_json(const DfuReport& r) {
    json errors = json::array();
    for (const auto& e : r.dfu_errors) {
        errors.push_back(json{
            {"timestamp_ms", e.timestamp_ms},
            {"packet_type", e.packet_type},
            {"reason", e.reason_code},
            {"reason_text", e.reason_text},
            {"context", e.context}});
    }
    return json{
        {"status", r.success ? "ok" : "error"},
        {"error_kind", to_string(r.kind)},
        {"message", r.message},
        {"state", to_string(r.state)},
        {"blocks_completed", r.blocks_completed},
        {"total_blocks", r.total_blocks},
        {"bytes_transferred", r.bytes_transferred},
        {"total_bytes", r.total_bytes},
        {"dfu_errors", errors}};
}

} // namespace bravejig
