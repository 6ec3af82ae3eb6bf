// ============================================================================
// firmware.cpp — implementation for firmware.hpp
// ============================================================================

#include "bravejig/firmware.hpp"
#include "bravejig/byte_order.hpp"

#include "etl/crc32.h"

#include <fstream>
#include <iterator>

namespace bravejig {

uint32_t crc32(const uint8_t* data, std::size_t len) {
    etl::crc32 crc;
    crc.add(data, data + len);
    return crc.value();
}

uint32_t crc32(const Bytes& data) { return crc32(data.data(), data.size()); }

bool has_embedded_crc(const Bytes& image) {
    if (image.size() <= 4) return false;
    const std::size_t body = image.size() - 4;
    return get_u32(&image[body]) == crc32(image.data(), body);
}

Bytes strip_embedded_crc(const Bytes& image, bool& stripped) {
    stripped = has_embedded_crc(image);
    if (!stripped) return image;
    return Bytes(image.begin(), image.end() - 4);
}

bool FirmwareSource::from_bytes(Bytes data, std::size_t max_bytes,
                                FirmwareSource& out, std::string& err) {
    if (data.empty()) { err = "firmware_empty"; return false; }
    if (data.size() > max_bytes) { err = "firmware_too_large"; return false; }
    out.data_ = std::move(data);
    out.origin_ = "<memory>";
    return true;
}

bool FirmwareSource::load(const std::string& path, std::size_t max_bytes,
                          FirmwareSource& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { err = "firmware_open_failed"; return false; }

    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) { err = "firmware_open_failed"; return false; }

    if (!from_bytes(std::move(data), max_bytes, out, err)) return false;
    out.origin_ = path;
    return true;
}

} // namespace bravejig
