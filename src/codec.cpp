// ============================================================================
// codec.cpp — implementation for codec.hpp
// For the packet layouts see packets.hpp. For usage examples, check tests/.
// ============================================================================

#include "bravejig/codec.hpp"
#include "bravejig/byte_order.hpp"

#include <algorithm>   // std::min
#include <chrono>      // unix_now
#include <iomanip>     // std::setw, std::setfill, std::hex
#include <sstream>     // std::ostringstream for describe()/to_hex()

namespace bravejig {

// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Every frame starts with [version][type]. Reserve enough for the fixed
// header so small packets don't reallocate mid-build.
// ---------------------------------------------------------------------------
static inline Bytes envelope(uint8_t type, std::size_t reserve) {
    Bytes b;
    b.reserve(reserve);
    b.push_back(PROTOCOL_VERSION);
    b.push_back(type);
    return b;
}

// ---------------------------------------------------------------------------
// Common prologue for all decoders: minimum length, then version.
// ---------------------------------------------------------------------------
static inline bool check_envelope(const Bytes& in, std::size_t min_len, DecodeError& err) {
    if (in.size() < min_len) { err = DecodeError::ShortPacket; return false; }
    if (in[0] != PROTOCOL_VERSION) { err = DecodeError::BadVersion; return false; }
    err = DecodeError::None;
    return true;
}

const char* to_string(DecodeError e) {
    switch (e) {
        case DecodeError::None:        return "none";
        case DecodeError::ShortPacket: return "short_packet";
        case DecodeError::BadVersion:  return "bad_version";
        case DecodeError::BadLength:   return "bad_length";
        case DecodeError::UnknownType: return "unknown_type";
    }
    return "unknown";
}

uint32_t unix_now() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

// ============================================================================
// Encoders
// ============================================================================

// [01,01,cmd][local_time u32][unix_time u32]
Bytes encode_jig_info_request(uint8_t cmd, uint32_t unix_time) {
    JigInfoRequest r;
    r.cmd = cmd;
    r.unix_time = unix_time;
    r.local_time = unix_time + JST_OFFSET_SECONDS;
    return encode(r);
}

Bytes encode(const JigInfoRequest& p) {
    auto b = envelope(TYPE_JIG_INFO_REQUEST, JIG_INFO_REQUEST_SIZE);
    put_u8(b, p.cmd);
    put_u32(b, p.local_time);
    put_u32(b, p.unix_time);
    return b;
}

Bytes encode(const JigInfoResponse& p) {
    auto b = envelope(p.type, JIG_INFO_RESPONSE_MIN + p.payload.size());
    put_u32(b, p.unix_time);
    put_u8(b, p.cmd);
    put_u64(b, p.router_id);
    b.insert(b.end(), p.payload.begin(), p.payload.end());
    return b;
}

Bytes encode_downlink_request(uint64_t device_id, uint16_t sensor_id, uint8_t cmd,
                              uint16_t order, const Bytes& data, uint32_t unix_time) {
    DownlinkRequest r;
    r.unix_time = unix_time;
    r.device_id = device_id;
    r.sensor_id = sensor_id;
    r.cmd = cmd;
    r.order = order;
    r.data = data;
    return encode(r);
}

// ---------------------------------------------------------------------------
// [01,00,data_len u16,unix u32,device u64,sensor u16,cmd u8,order u16,data…]
// data_len counts only the trailing data bytes.
// ---------------------------------------------------------------------------
Bytes encode(const DownlinkRequest& p) {
    auto b = envelope(TYPE_DOWNLINK_REQUEST, DOWNLINK_REQUEST_HEADER + p.data.size());
    put_u16(b, static_cast<uint16_t>(p.data.size()));
    put_u32(b, p.unix_time);
    put_u64(b, p.device_id);
    put_u16(b, p.sensor_id);
    put_u8(b, p.cmd);
    put_u16(b, p.order);
    b.insert(b.end(), p.data.begin(), p.data.end());
    return b;
}

Bytes encode(const DownlinkResponse& p) {
    auto b = envelope(p.type, DOWNLINK_RESPONSE_FULL);
    if (p.form == DownlinkForm::Compact) {
        put_u16(b, p.data_length);
        put_u32(b, p.unix_time);
        put_u64(b, p.device_id);
        put_u16(b, p.sensor_id);
        put_u8(b, p.result);
    } else {
        put_u32(b, p.unix_time);
        put_u64(b, p.device_id);
        put_u16(b, p.sensor_id);
        put_u16(b, p.order);
        put_u8(b, p.cmd);
        put_u8(b, p.result);
    }
    return b;
}

Bytes encode(const UplinkNotification& p) {
    auto b = envelope(p.type, UPLINK_HEADER + p.payload.size());
    put_u16(b, p.data_length);
    put_u32(b, p.unix_time);
    put_u64(b, p.device_id);
    put_u16(b, p.sensor_id);
    put_u8(b, static_cast<uint8_t>(p.rssi));
    put_u16(b, p.order);
    b.insert(b.end(), p.payload.begin(), p.payload.end());
    return b;
}

Bytes encode_dfu_request(uint32_t total_length, uint32_t unix_time) {
    return encode(DfuRequest{unix_time, total_length});
}

// [01,03,unix u32,total_length u32]
Bytes encode(const DfuRequest& p) {
    auto b = envelope(TYPE_DFU, DFU_REQUEST_SIZE);
    put_u32(b, p.unix_time);
    put_u32(b, p.total_length);
    return b;
}

Bytes encode(const DfuResponse& p) {
    auto b = envelope(TYPE_DFU, DFU_RESPONSE_MIN);
    put_u32(b, p.unix_time);
    put_u8(b, p.result);
    return b;
}

Bytes encode(const ErrorNotification& p) {
    auto b = envelope(p.type, ERROR_NOTIFICATION_SIZE);
    put_u32(b, p.unix_time);
    put_u8(b, p.reason);
    return b;
}

// ---------------------------------------------------------------------------
// Router DFU chunk: raw [packet_size u16][chunk bytes], no envelope.
// ---------------------------------------------------------------------------
Bytes encode_dfu_chunk(const uint8_t* data, std::size_t len) {
    Bytes b;
    b.reserve(2 + len);
    put_u16(b, static_cast<uint16_t>(len));
    b.insert(b.end(), data, data + len);
    return b;
}

std::vector<Bytes> split_firmware_into_chunks(const Bytes& firmware, std::size_t chunk_size) {
    std::vector<Bytes> chunks;
    if (chunk_size == 0) return chunks;
    chunks.reserve((firmware.size() + chunk_size - 1) / chunk_size);
    for (std::size_t off = 0; off < firmware.size(); off += chunk_size) {
        const std::size_t n = std::min(chunk_size, firmware.size() - off);
        chunks.push_back(encode_dfu_chunk(firmware.data() + off, n));
    }
    return chunks;
}

// ============================================================================
// Decoders
// ============================================================================

bool decode_jig_info_request(const Bytes& in, JigInfoRequest& out, DecodeError& err) {
    if (!check_envelope(in, JIG_INFO_REQUEST_SIZE, err)) return false;
    out.cmd        = in[2];
    out.local_time = get_u32(&in[3]);
    out.unix_time  = get_u32(&in[7]);
    return true;
}

// [ver,type,unix u32,cmd,router_id u64,payload…]
bool decode_jig_info_response(const Bytes& in, JigInfoResponse& out, DecodeError& err) {
    if (!check_envelope(in, JIG_INFO_RESPONSE_MIN, err)) return false;
    out.type      = in[1];
    out.unix_time = get_u32(&in[2]);
    out.cmd       = in[6];
    out.router_id = get_u64(&in[7]);
    out.payload.assign(in.begin() + JIG_INFO_RESPONSE_MIN, in.end());
    return true;
}

bool decode_downlink_request(const Bytes& in, DownlinkRequest& out, DecodeError& err) {
    if (!check_envelope(in, DOWNLINK_REQUEST_HEADER, err)) return false;
    const uint16_t data_len = get_u16(&in[2]);
    if (in.size() != DOWNLINK_REQUEST_HEADER + data_len) {
        err = DecodeError::BadLength;
        return false;
    }
    out.unix_time = get_u32(&in[4]);
    out.device_id = get_u64(&in[8]);
    out.sensor_id = get_u16(&in[16]);
    out.cmd       = in[18];
    out.order     = get_u16(&in[19]);
    out.data.assign(in.begin() + DOWNLINK_REQUEST_HEADER, in.end());
    return true;
}

// ---------------------------------------------------------------------------
// Two fixed layouts, selected by total length:
//   19: [ver,type,data_len u16,unix u32,device u64,sensor u16,result]
//   20: [ver,type,unix u32,device u64,sensor u16,order u16,cmd,result]
// Any other length is a protocol error rather than a guess.
// ---------------------------------------------------------------------------
bool decode_downlink_response(const Bytes& in, DownlinkResponse& out, DecodeError& err) {
    if (!check_envelope(in, DOWNLINK_RESPONSE_COMPACT, err)) return false;
    out.type = in[1];
    if (in.size() == DOWNLINK_RESPONSE_COMPACT) {
        out.form        = DownlinkForm::Compact;
        out.data_length = get_u16(&in[2]);
        out.unix_time   = get_u32(&in[4]);
        out.device_id   = get_u64(&in[8]);
        out.sensor_id   = get_u16(&in[16]);
        out.order       = 0;
        out.cmd         = 0;
        out.result      = in[18];
        return true;
    }
    if (in.size() == DOWNLINK_RESPONSE_FULL) {
        out.form        = DownlinkForm::Full;
        out.data_length = 0;
        out.unix_time   = get_u32(&in[2]);
        out.device_id   = get_u64(&in[6]);
        out.sensor_id   = get_u16(&in[14]);
        out.order       = get_u16(&in[16]);
        out.cmd         = in[18];
        out.result      = in[19];
        return true;
    }
    err = DecodeError::BadLength;
    return false;
}

bool decode_uplink_notification(const Bytes& in, UplinkNotification& out, DecodeError& err) {
    if (!check_envelope(in, UPLINK_HEADER, err)) return false;
    out.type        = in[1];
    out.data_length = get_u16(&in[2]);
    out.unix_time   = get_u32(&in[4]);
    out.device_id   = get_u64(&in[8]);
    out.sensor_id   = get_u16(&in[16]);
    out.rssi        = static_cast<int8_t>(in[18]);
    out.order       = get_u16(&in[19]);
    out.payload.assign(in.begin() + UPLINK_HEADER, in.end());
    return true;
}

bool decode_dfu_request(const Bytes& in, DfuRequest& out, DecodeError& err) {
    if (!check_envelope(in, DFU_REQUEST_SIZE, err)) return false;
    out.unix_time    = get_u32(&in[2]);
    out.total_length = get_u32(&in[6]);
    return true;
}

bool decode_dfu_response(const Bytes& in, DfuResponse& out, DecodeError& err) {
    if (!check_envelope(in, DFU_RESPONSE_MIN, err)) return false;
    out.unix_time = get_u32(&in[2]);
    out.result    = in[6];
    return true;
}

bool decode_error_notification(const Bytes& in, ErrorNotification& out, DecodeError& err) {
    if (!check_envelope(in, ERROR_NOTIFICATION_SIZE, err)) return false;
    if (in.size() != ERROR_NOTIFICATION_SIZE) { err = DecodeError::BadLength; return false; }
    out.type      = in[1];
    out.unix_time = get_u32(&in[2]);
    out.reason    = in[6];
    return true;
}

// ============================================================================
// Classification
// ============================================================================

// ---------------------------------------------------------------------------
// try_as<T>()
// -----------
// Decode into a temporary and move it into the Frame only on success, so a
// failed first attempt never leaves a half-filled alternative behind.
// ---------------------------------------------------------------------------
template <typename T>
static bool try_as(bool (*decoder)(const Bytes&, T&, DecodeError&),
                   const Bytes& in, Frame& out, DecodeError& err) {
    T tmp;
    if (!decoder(in, tmp, err)) return false;
    out = std::move(tmp);
    return true;
}

bool classify_and_decode(const Bytes& in, Frame& out, DecodeError& err) {
    if (in.size() < 2) { err = DecodeError::ShortPacket; return false; }
    if (in[0] != PROTOCOL_VERSION) { err = DecodeError::BadVersion; return false; }

    DecodeError first = DecodeError::None;
    switch (in[1]) {
        case TYPE_UPLINK:
            return try_as(decode_uplink_notification, in, out, err);

        case TYPE_DOWNLINK_RESPONSE:
        case TYPE_JIG_INFO_RESPONSE: {
            // Type 0x01 tries Downlink first at both fixed Downlink lengths.
            // Type 0x02 is what the router uses for JIG-Info, so only the
            // 19-byte compact length goes to Downlink first; a 20-byte
            // JIG-Info reply (5-byte payload) must stay JIG-Info.
            const bool downlink_first = in.size() == DOWNLINK_RESPONSE_COMPACT ||
                (in[1] == TYPE_DOWNLINK_RESPONSE && in.size() == DOWNLINK_RESPONSE_FULL);
            if (downlink_first) {
                if (try_as(decode_downlink_response, in, out, first)) { err = first; return true; }
                if (try_as(decode_jig_info_response, in, out, err)) return true;
            } else {
                if (try_as(decode_jig_info_response, in, out, first)) { err = first; return true; }
                if (try_as(decode_downlink_response, in, out, err)) return true;
            }
            err = first;
            return false;
        }

        case TYPE_DFU:
            if (try_as(decode_dfu_response, in, out, first)) { err = first; return true; }
            if (try_as(decode_uplink_notification, in, out, err)) return true;
            err = first;
            return false;

        case TYPE_ERROR_LEGACY:
        case TYPE_ERROR:
            return try_as(decode_error_notification, in, out, err);

        default:
            err = DecodeError::UnknownType;
            return false;
    }
}

// ============================================================================
// Interpretation
// ============================================================================

std::string interpret_error_reason(uint8_t reason) {
    switch (reason) {
        case 0x01: return "invalid request";
        case 0x02: return "downlink in progress";
        case 0x03:
        case 0x04:
        case 0x05: return "reserved";
        case 0x06: return "device id not registered at index";
        case 0x07: return "device not found";   // seen on hardware, not in the table
        default: {
            std::ostringstream os;
            os << "unknown error reason: 0x" << std::hex << std::setw(2) << std::setfill('0')
               << static_cast<int>(reason);
            return os.str();
        }
    }
}

const char* error_type_name(uint8_t type) {
    if (type == TYPE_ERROR_LEGACY) return "Legacy Error";
    if (type == TYPE_ERROR)        return "Router Error Notification";
    return "Unknown Error Type";
}

const char* downlink_result_text(uint8_t result) {
    switch (result) {
        case 0x00: return "Success";
        case 0x01: return "Invalid Sensor ID";
        case 0x02: return "Unsupported CMD";
        case 0x03: return "Parameter out of range";
        case 0x04: return "Connection failed";
        case 0x05: return "Timeout";
        case 0x07: return "Device not found";
        case 0x08: return "Router busy";
        case 0x09: return "Module busy";
        default:   return "Unknown result";
    }
}

std::string jig_info_command_name(uint8_t cmd) {
    switch (cmd) {
        case JIG_ROUTER_STOP:              return "ROUTER_STOP";
        case JIG_ROUTER_START:             return "ROUTER_START";
        case JIG_GET_VERSION:              return "GET_VERSION";
        case JIG_GET_SCAN_MODE:            return "GET_SCAN_MODE";
        case JIG_SET_SCAN_MODE_LONG_RANGE: return "SET_SCAN_MODE_LONG_RANGE";
        case JIG_SET_SCAN_MODE_LEGACY:     return "SET_SCAN_MODE_LEGACY";
        case JIG_REMOVE_DEVICE_ID_ALL:     return "REMOVE_DEVICE_ID_ALL";
        case JIG_GET_DEVICE_ID_ALL:        return "GET_DEVICE_ID_ALL";
        case JIG_KEEP_ALIVE:               return "KEEP_ALIVE";
        default: break;
    }
    if (cmd >= JIG_GET_DEVICE_ID_BASE && cmd <= JIG_GET_DEVICE_ID_BASE + MAX_DEVICE_INDEX)
        return "GET_DEVICE_ID_INDEX_" + std::to_string(cmd - JIG_GET_DEVICE_ID_BASE);
    if (cmd >= JIG_REMOVE_DEVICE_ID_BASE && cmd <= JIG_REMOVE_DEVICE_ID_BASE + MAX_DEVICE_INDEX)
        return "REMOVE_DEVICE_ID_INDEX_" + std::to_string(cmd - JIG_REMOVE_DEVICE_ID_BASE);
    return "UNKNOWN";
}

const char* frame_kind(const Frame& f) {
    switch (f.index()) {
        case 0: return "uplink";
        case 1: return "jig_info";
        case 2: return "downlink";
        case 3: return "dfu";
        case 4: return "error";
    }
    return "unknown";
}

std::string to_hex(const uint8_t* p, std::size_t n) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < n; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(p[i]);
    }
    return os.str();
}

std::string to_hex(const Bytes& b) { return to_hex(b.data(), b.size()); }

// ---------------------------------------------------------------------------
// describe()
// ----------
// key=value summary for logs and the monitor. Device IDs print as 16 hex
// digits, sensor IDs as 0xNNNN, matching how operators write them on the CLI.
// ---------------------------------------------------------------------------
namespace {

std::string hex_id(uint64_t v, int width) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setw(width) << std::setfill('0') << v;
    return os.str();
}

struct Describer {
    std::ostringstream& os;

    void operator()(const UplinkNotification& u) const {
        os << "kind=uplink device_id=" << hex_id(u.device_id, 16)
           << " sensor_id=0x" << hex_id(u.sensor_id, 4)
           << " rssi=" << static_cast<int>(u.rssi)
           << " order=" << u.order
           << " unix_time=" << u.unix_time
           << " payload_len=" << u.payload.size();
        if (!u.payload.empty()) os << " payload=\"" << to_hex(u.payload) << "\"";
    }
    void operator()(const JigInfoResponse& j) const {
        os << "kind=jig_info cmd=" << jig_info_command_name(j.cmd)
           << " router_id=" << hex_id(j.router_id, 16)
           << " unix_time=" << j.unix_time
           << " payload_len=" << j.payload.size();
        if (!j.payload.empty()) os << " payload=\"" << to_hex(j.payload) << "\"";
    }
    void operator()(const DownlinkResponse& d) const {
        os << "kind=downlink device_id=" << hex_id(d.device_id, 16)
           << " sensor_id=0x" << hex_id(d.sensor_id, 4);
        if (d.form == DownlinkForm::Full)
            os << " cmd=0x" << hex_id(d.cmd, 2) << " order=" << d.order;
        os << " result=0x" << hex_id(d.result, 2)
           << " result_text=\"" << downlink_result_text(d.result) << "\"";
    }
    void operator()(const DfuResponse& r) const {
        os << "kind=dfu result=0x" << hex_id(r.result, 2)
           << " ready=" << (r.result == DFU_RESULT_READY ? "yes" : "no")
           << " unix_time=" << r.unix_time;
    }
    void operator()(const ErrorNotification& e) const {
        os << "kind=error type=\"" << error_type_name(e.type) << "\""
           << " reason=0x" << hex_id(e.reason, 2)
           << " reason_text=\"" << interpret_error_reason(e.reason) << "\""
           << " unix_time=" << e.unix_time;
    }
};

} // namespace

std::string describe(const Frame& f) {
    std::ostringstream os;
    std::visit(Describer{os}, f);
    return os.str();
}

} // namespace bravejig
