/**
 * @page bj-packets BraveJIG Packet Model
 * @file packets.hpp
 * @brief Wire constants and plain structs for every BraveJIG packet kind.
 *
 * @details
 * PURPOSE
 * -------
 * Everything that crosses the serial link between the host and the router
 * is described here as a flat struct with no behavior. codec.hpp turns them
 * into bytes and back; the rest of the library passes them around by value.
 *
 * WIRE ENVELOPE
 * -------------
 *   byte 0 : protocol version (always 0x01)
 *   byte 1 : packet type
 *   byte 2…: type-specific body, all multi-byte integers little-endian
 *
 * TYPE BYTES
 * ----------
 * The router reuses type bytes across directions and, worse, across inbound
 * kinds: 0x02 carries both JIG-Info and Downlink responses, 0x03 carries
 * both DFU responses and uplinks. Classification lives in one place only
 * (classify_and_decode() in codec.hpp).
 *
 *   | Type | Outbound            | Inbound                          |
 *   |------|---------------------|----------------------------------|
 *   | 0x00 | Downlink request    | Uplink notification              |
 *   | 0x01 | JIG-Info request    | Downlink response (20-byte form) |
 *   | 0x02 |                     | JIG-Info / Downlink response     |
 *   | 0x03 | DFU request         | DFU response / uplink            |
 *   | 0x04 |                     | Error notification (legacy)      |
 *   | 0xFF |                     | Error notification               |
 *
 * MAINTENANCE
 * -----------
 * Opcodes and sizes are part of the wire contract. Add, never renumber.
 */
#ifndef BRAVEJIG_PACKETS_HPP
#define BRAVEJIG_PACKETS_HPP

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace bravejig {

using Bytes = std::vector<uint8_t>;

constexpr uint8_t PROTOCOL_VERSION = 0x01;

// =============================== Type bytes ===============================
enum : uint8_t {
    TYPE_DOWNLINK_REQUEST  = 0x00,
    TYPE_UPLINK            = 0x00,
    TYPE_JIG_INFO_REQUEST  = 0x01,
    TYPE_DOWNLINK_RESPONSE = 0x01,
    TYPE_JIG_INFO_RESPONSE = 0x02,
    TYPE_DFU               = 0x03,
    TYPE_ERROR_LEGACY      = 0x04,
    TYPE_ERROR             = 0xFF
};

// ================================= Sizes ==================================
constexpr std::size_t JIG_INFO_REQUEST_SIZE       = 11;
constexpr std::size_t JIG_INFO_RESPONSE_MIN       = 15;
constexpr std::size_t DOWNLINK_REQUEST_HEADER     = 21;
constexpr std::size_t DOWNLINK_RESPONSE_COMPACT   = 19;  ///< [ver,type,len,time,dev,sensor,result]
constexpr std::size_t DOWNLINK_RESPONSE_FULL      = 20;  ///< [ver,type,time,dev,sensor,order,cmd,result]
constexpr std::size_t UPLINK_HEADER               = 21;
constexpr std::size_t DFU_REQUEST_SIZE            = 10;
constexpr std::size_t DFU_RESPONSE_MIN            = 7;
constexpr std::size_t ERROR_NOTIFICATION_SIZE     = 7;

/// Local time sent in JIG-Info requests is unix time shifted to JST.
constexpr uint32_t JST_OFFSET_SECONDS = 9 * 3600;

// =========================== JIG-Info commands ============================
/**
 * @name JIG-Info command bytes
 * @brief Commands addressed to the router itself.
 *
 * GET_DEVICE_ID and REMOVE_DEVICE_ID are ranges: the table index (0..99) is
 * added to the base opcode.
 */
enum : uint8_t {
    JIG_ROUTER_STOP              = 0x00,
    JIG_ROUTER_START             = 0x01,
    JIG_GET_VERSION              = 0x02,
    JIG_GET_DEVICE_ID_BASE       = 0x03,  ///< + index, 0x03..0x66
    JIG_GET_SCAN_MODE            = 0x67,
    JIG_SET_SCAN_MODE_LONG_RANGE = 0x69,
    JIG_SET_SCAN_MODE_LEGACY     = 0x6A,
    JIG_REMOVE_DEVICE_ID_ALL     = 0x6B,
    JIG_REMOVE_DEVICE_ID_BASE    = 0x6C,  ///< + index, 0x6C..0xCE
    JIG_GET_DEVICE_ID_ALL        = 0xCF,
    JIG_KEEP_ALIVE               = 0xD0
};

constexpr uint8_t MAX_DEVICE_INDEX = 99;

// ======================= Module (Downlink) commands =======================
enum : uint8_t {
    MODULE_INSTANT_UPLINK  = 0x00,
    MODULE_SET_PARAMETER   = 0x05,
    MODULE_GET_PARAMETER   = 0x0D,
    MODULE_SENSOR_DFU      = 0x12,
    MODULE_DEVICE_RESTART  = 0xFD
};

/// sensor_id reserved for the end-device main unit.
constexpr uint16_t SENSOR_MAIN_UNIT = 0x0000;

// ============================= Result bytes ===============================
constexpr uint8_t DOWNLINK_RESULT_SUCCESS = 0x00;
constexpr uint8_t DFU_RESULT_READY        = 0x01;
constexpr uint8_t JIG_ACK_SUCCESS         = 0x01;

// ================================ Packets =================================

struct JigInfoRequest {
    uint8_t  cmd{0};
    uint32_t local_time{0};
    uint32_t unix_time{0};
};

/// Payload is command specific and left uninterpreted here (see router.hpp).
struct JigInfoResponse {
    uint8_t  type{TYPE_JIG_INFO_RESPONSE};
    uint32_t unix_time{0};
    uint8_t  cmd{0};
    uint64_t router_id{0};
    Bytes    payload;
};

struct DownlinkRequest {
    uint32_t unix_time{0};
    uint64_t device_id{0};
    uint16_t sensor_id{0};
    uint8_t  cmd{0};
    uint16_t order{0};
    Bytes    data;
};

/**
 * @brief Router's answer to a DownlinkRequest.
 *
 * The router emits two fixed layouts; which one is told apart by total
 * length only. The compact form carries a length field but no order/cmd.
 */
enum class DownlinkForm : uint8_t { Compact, Full };

struct DownlinkResponse {
    DownlinkForm form{DownlinkForm::Full};
    uint8_t  type{TYPE_DOWNLINK_RESPONSE};
    uint16_t data_length{0};   ///< compact form only
    uint32_t unix_time{0};
    uint64_t device_id{0};
    uint16_t sensor_id{0};
    uint16_t order{0};         ///< full form only
    uint8_t  cmd{0};           ///< full form only
    uint8_t  result{0};
};

struct UplinkNotification {
    uint8_t  type{TYPE_UPLINK};
    uint16_t data_length{0};
    uint32_t unix_time{0};
    uint64_t device_id{0};
    uint16_t sensor_id{0};
    int8_t   rssi{0};
    uint16_t order{0};
    Bytes    payload;

    bool is_parameter_info() const { return sensor_id == SENSOR_MAIN_UNIT; }
};

struct DfuRequest {
    uint32_t unix_time{0};
    uint32_t total_length{0};
};

struct DfuResponse {
    uint32_t unix_time{0};
    uint8_t  result{0};
};

struct ErrorNotification {
    uint8_t  type{TYPE_ERROR};
    uint32_t unix_time{0};
    uint8_t  reason{0};
};

/// Decoded inbound frame. The Dispatcher switches on the active member.
using Frame = std::variant<UplinkNotification,
                           JigInfoResponse,
                           DownlinkResponse,
                           DfuResponse,
                           ErrorNotification>;

// ------------------------------ Equality ---------------------------------

inline bool operator==(const JigInfoRequest& a, const JigInfoRequest& b) {
    return a.cmd == b.cmd && a.local_time == b.local_time && a.unix_time == b.unix_time;
}
inline bool operator==(const JigInfoResponse& a, const JigInfoResponse& b) {
    return a.type == b.type && a.unix_time == b.unix_time && a.cmd == b.cmd &&
           a.router_id == b.router_id && a.payload == b.payload;
}
inline bool operator==(const DownlinkRequest& a, const DownlinkRequest& b) {
    return a.unix_time == b.unix_time && a.device_id == b.device_id &&
           a.sensor_id == b.sensor_id && a.cmd == b.cmd && a.order == b.order &&
           a.data == b.data;
}
inline bool operator==(const DownlinkResponse& a, const DownlinkResponse& b) {
    return a.form == b.form && a.type == b.type && a.data_length == b.data_length &&
           a.unix_time == b.unix_time && a.device_id == b.device_id &&
           a.sensor_id == b.sensor_id && a.order == b.order && a.cmd == b.cmd &&
           a.result == b.result;
}
inline bool operator==(const UplinkNotification& a, const UplinkNotification& b) {
    return a.type == b.type && a.data_length == b.data_length && a.unix_time == b.unix_time &&
           a.device_id == b.device_id && a.sensor_id == b.sensor_id && a.rssi == b.rssi &&
           a.order == b.order && a.payload == b.payload;
}
inline bool operator==(const DfuRequest& a, const DfuRequest& b) {
    return a.unix_time == b.unix_time && a.total_length == b.total_length;
}
inline bool operator==(const DfuResponse& a, const DfuResponse& b) {
    return a.unix_time == b.unix_time && a.result == b.result;
}
inline bool operator==(const ErrorNotification& a, const ErrorNotification& b) {
    return a.type == b.type && a.unix_time == b.unix_time && a.reason == b.reason;
}

} // namespace bravejig

#endif // BRAVEJIG_PACKETS_HPP
