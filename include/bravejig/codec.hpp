#pragma once
/**
 * @page bj-codec BraveJIG Codec
 * @file codec.hpp
 * @brief Stateless encode/decode for every packet kind, plus the inbound classifier.
 *
 * @details
 * PURPOSE
 * -------
 * Pure functions over byte vectors. No I/O, no clocks, no globals: callers
 * pass the unix time they want stamped into a request. Decoders never throw;
 * they return false and set a DecodeError so the Dispatcher can log and drop.
 *
 * CLASSIFICATION
 * --------------
 * classify_and_decode() is the only place that knows how the router's
 * reused type bytes are told apart:
 *
 *   0x00        -> uplink
 *   0x01        -> length 19/20: Downlink first, then JIG-Info
 *                  otherwise:    JIG-Info first, then Downlink
 *   0x02        -> length 19:    Downlink first, then JIG-Info
 *                  otherwise:    JIG-Info first, then Downlink
 *   0x03        -> DFU response first, then uplink
 *   0x04, 0xFF  -> error notification (exactly 7 bytes)
 *   anything else -> DecodeError::UnknownType
 *
 * The ambiguity is in the router firmware, so the order above is kept as is.
 *
 * EXAMPLE
 * -------
 * @code
 *   bravejig::Frame f;
 *   bravejig::DecodeError err;
 *   if (!bravejig::classify_and_decode(rx, f, err)) {
 *       log.warn("codec", "drop", "reason=" + std::string(to_string(err)));
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bravejig/packets.hpp"

namespace bravejig {

enum class DecodeError : uint8_t {
    None,
    ShortPacket,   ///< fewer bytes than the layout needs
    BadVersion,    ///< byte 0 is not PROTOCOL_VERSION
    BadLength,     ///< length matches no known fixed layout
    UnknownType    ///< type byte not used by any inbound packet
};

/// Stable snake_case name for logs and CLI output.
const char* to_string(DecodeError e);

/// Router DFU chunks carry at most this many firmware bytes.
constexpr std::size_t ROUTER_DFU_CHUNK_MAX = 1024;

/// Seconds since the epoch, truncated to 32 bits as the wire carries it.
uint32_t unix_now();

// ------------------------------- Encoders --------------------------------

Bytes encode_jig_info_request(uint8_t cmd, uint32_t unix_time);
Bytes encode_downlink_request(uint64_t device_id, uint16_t sensor_id, uint8_t cmd,
                              uint16_t order, const Bytes& data, uint32_t unix_time);
Bytes encode_dfu_request(uint32_t total_length, uint32_t unix_time);

/**
 * @brief Build one in-session router DFU chunk: [size u16][bytes].
 *
 * No envelope; this sub-protocol is only valid after DFU initiation succeeded.
 * @param len must be 1..ROUTER_DFU_CHUNK_MAX.
 */
Bytes encode_dfu_chunk(const uint8_t* data, std::size_t len);

/// Split firmware into ceil(N / chunk_size) encoded chunks.
std::vector<Bytes> split_firmware_into_chunks(const Bytes& firmware,
                                              std::size_t chunk_size = ROUTER_DFU_CHUNK_MAX);

// Struct encoders. The response/notification forms exist for fakes and tests.
Bytes encode(const JigInfoRequest& p);
Bytes encode(const JigInfoResponse& p);
Bytes encode(const DownlinkRequest& p);
Bytes encode(const DownlinkResponse& p);
Bytes encode(const UplinkNotification& p);
Bytes encode(const DfuRequest& p);
Bytes encode(const DfuResponse& p);
Bytes encode(const ErrorNotification& p);

// ------------------------------- Decoders --------------------------------

bool decode_jig_info_request(const Bytes& in, JigInfoRequest& out, DecodeError& err);
bool decode_jig_info_response(const Bytes& in, JigInfoResponse& out, DecodeError& err);
bool decode_downlink_request(const Bytes& in, DownlinkRequest& out, DecodeError& err);

/// Accepts exactly 19 (compact) or 20 (full) bytes; the form is picked by length.
bool decode_downlink_response(const Bytes& in, DownlinkResponse& out, DecodeError& err);
bool decode_uplink_notification(const Bytes& in, UplinkNotification& out, DecodeError& err);
bool decode_dfu_request(const Bytes& in, DfuRequest& out, DecodeError& err);
bool decode_dfu_response(const Bytes& in, DfuResponse& out, DecodeError& err);
bool decode_error_notification(const Bytes& in, ErrorNotification& out, DecodeError& err);

/// Classify an inbound frame by its type byte and decode it (see file docs).
bool classify_and_decode(const Bytes& in, Frame& out, DecodeError& err);

// ----------------------------- Interpretation ----------------------------

/// Reason text for an ErrorNotification reason byte.
std::string interpret_error_reason(uint8_t reason);

/// "Legacy Error" for 0x04, "Router Error Notification" for 0xFF.
const char* error_type_name(uint8_t type);

/// Human text for a DownlinkResponse result byte.
const char* downlink_result_text(uint8_t result);

/// Symbolic name of a JIG-Info command byte, e.g. GET_DEVICE_ID_INDEX_5.
std::string jig_info_command_name(uint8_t cmd);

/// Name of the active Frame member: uplink, jig_info, downlink, dfu, error.
const char* frame_kind(const Frame& f);

/// One-line key=value summary, stable for grep and scripts.
std::string describe(const Frame& f);

/// Upper-case hex, bytes separated by spaces.
std::string to_hex(const Bytes& b);
std::string to_hex(const uint8_t* p, std::size_t n);

} // namespace bravejig
