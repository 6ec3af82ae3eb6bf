#pragma once
/**
 * @page bj-module BraveJIG Module Commands (Downlink)
 * @file module.hpp
 * @brief Generic commands addressed to a sensor module through the router.
 *
 * @details
 * Every command is one DownlinkRequest to (device_id, sensor_id) and waits
 * for the Downlink response under downlink_<device>_<sensor>. A result byte
 * other than 0x00 becomes ErrorKind::Device with the result description.
 *
 * Two commands are answered twice: the Downlink response only says the
 * router accepted the request, and the data arrives later as an uplink.
 *   - instant_uplink: next uplink from that device (and sensor, if given)
 *   - get_parameter:  next uplink from that device with sensor_id 0x0000
 * The uplink waiter is registered before the request goes out so a fast
 * module can't beat it.
 *
 * Parameter blobs are opaque here; per-sensor layouts live with the caller.
 */

#include <chrono>
#include <cstdint>
#include <optional>

#include "bravejig/packets.hpp"
#include "bravejig/result.hpp"

namespace bravejig {

class CommandEngine;
class Dispatcher;
class Logger;

class ModuleCommands {
public:
    ModuleCommands(CommandEngine& engine, Dispatcher& dispatcher, Logger& log,
                   std::chrono::milliseconds command_timeout,
                   std::chrono::milliseconds uplink_timeout);

    /// One Downlink round trip. Used by every command below and by sensor DFU.
    CommandResult downlink(uint64_t device_id, uint16_t sensor_id, uint8_t cmd,
                           uint16_t order, const Bytes& data,
                           std::chrono::milliseconds timeout);

    /// On success the response holds the UplinkNotification.
    CommandResult instant_uplink(uint64_t device_id, std::optional<uint16_t> sensor_id);

    /// On success the response holds the parameter uplink; blob_out gets its payload.
    CommandResult get_parameter(uint64_t device_id, Bytes& blob_out);

    CommandResult set_parameter(uint64_t device_id, uint16_t sensor_id, const Bytes& blob);
    CommandResult device_restart(uint64_t device_id);

    std::chrono::milliseconds command_timeout() const { return command_timeout_; }

private:
    CommandResult with_uplink(uint64_t device_id, uint16_t request_sensor, uint8_t cmd,
                              std::optional<uint16_t> uplink_sensor);

    CommandEngine& engine_;
    Dispatcher& dispatcher_;
    Logger& log_;
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds uplink_timeout_;
};

} // namespace bravejig
