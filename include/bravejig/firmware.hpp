#pragma once
/**
 * @file firmware.hpp
 * @brief Firmware image handed to the DFU engines: loaded, size-checked, non-empty.
 *
 * Images sometimes arrive with their own CRC32 appended (little-endian, over
 * everything before it). strip_embedded_crc() detects that so the sensor
 * DFU can recompute the CRC over the real payload instead of double-counting.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "bravejig/packets.hpp"

namespace bravejig {

/// zlib-compatible CRC32 (reflected 0x04C11DB7, init/xorout 0xFFFFFFFF).
uint32_t crc32(const uint8_t* data, std::size_t len);
uint32_t crc32(const Bytes& data);

/// True if the last 4 bytes are the LE CRC32 of everything before them.
bool has_embedded_crc(const Bytes& image);

/// Copy of image without a trailing CRC32, if has_embedded_crc(); otherwise the image itself.
Bytes strip_embedded_crc(const Bytes& image, bool& stripped);

class FirmwareSource {
public:
    FirmwareSource() = default;

    /// Read a whole file. err: firmware_open_failed | firmware_empty | firmware_too_large
    static bool load(const std::string& path, std::size_t max_bytes,
                     FirmwareSource& out, std::string& err);

    static bool from_bytes(Bytes data, std::size_t max_bytes,
                           FirmwareSource& out, std::string& err);

    const Bytes& bytes() const { return data_; }
    std::size_t size() const { return data_.size(); }
    const std::string& origin() const { return origin_; }

private:
    Bytes data_;
    std::string origin_;
};

} // namespace bravejig
