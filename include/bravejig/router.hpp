#pragma once
/**
 * @page bj-router BraveJIG Router Commands (JIG Info)
 * @file router.hpp
 * @brief Typed wrappers for every JIG-Info command, on top of CommandEngine.
 *
 * @details
 * Each wrapper encodes one JIG-Info request, runs it under jig_info_<cmd>
 * and interprets the response payload. The codec leaves payloads opaque;
 * the parse_* helpers below are the only place their layout is known:
 *
 *   | Command             | Payload                                  |
 *   |---------------------|------------------------------------------|
 *   | GET_VERSION         | major, minor, build                      |
 *   | GET_DEVICE_ID_n     | index, device_id u64                     |
 *   | GET_DEVICE_ID_ALL   | count, count x device_id u64             |
 *   | GET_SCAN_MODE       | mode (0 Long Range, 1 Legacy)            |
 *   | everything else     | one success byte, 0x01 = success         |
 *
 * Router failures that come back as error notifications (e.g. reason 0x06,
 * nothing registered at that index) reach the caller as ErrorKind::Device
 * through the Dispatcher.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "bravejig/packets.hpp"
#include "bravejig/result.hpp"

namespace bravejig {

class CommandEngine;
class Logger;

struct RouterVersion {
    uint8_t major{0};
    uint8_t minor{0};
    uint8_t build{0};
    std::string to_string() const;
};

struct DeviceIdEntry {
    uint8_t  index{0};
    uint64_t device_id{0};
};

enum class ScanMode : uint8_t { LongRange = 0, Legacy = 1 };

const char* to_string(ScanMode m);
bool scan_mode_from_int(int v, ScanMode& out);

// Payload interpreters. false when the payload is too short for the layout.
bool parse_success_byte(const Bytes& payload, bool& success);
bool parse_version(const Bytes& payload, RouterVersion& out);
bool parse_device_id(const Bytes& payload, DeviceIdEntry& out);
bool parse_device_id_all(const Bytes& payload, std::vector<uint64_t>& out);
bool parse_scan_mode(const Bytes& payload, ScanMode& out);

class RouterCommands {
public:
    RouterCommands(CommandEngine& engine, Logger& log, std::chrono::milliseconds timeout);

    CommandResult start();
    CommandResult stop();
    CommandResult keep_alive();
    CommandResult get_version(RouterVersion& out);
    CommandResult get_device_id(int index, DeviceIdEntry& out);
    CommandResult get_device_id_all(std::vector<uint64_t>& out);
    CommandResult get_scan_mode(ScanMode& out);
    CommandResult set_scan_mode(ScanMode mode);
    CommandResult remove_device_id(int index);
    CommandResult remove_device_id_all();

private:
    /// On success the response is guaranteed to hold a JigInfoResponse.
    CommandResult query(uint8_t cmd);
    CommandResult acknowledged(uint8_t cmd);

    CommandEngine& engine_;
    Logger& log_;
    std::chrono::milliseconds timeout_;
};

} // namespace bravejig
