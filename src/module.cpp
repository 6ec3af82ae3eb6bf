// ============================================================================
// module.cpp — implementation for module.hpp
// ============================================================================

#include "bravejig/module.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/command_engine.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/dispatcher.hpp"
#include "bravejig/logger.hpp"

#include <cstdio>

namespace bravejig {

static std::string id_fields(uint64_t device_id, uint16_t sensor_id) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "device_id=%016llX sensor_id=0x%04X",
                  static_cast<unsigned long long>(device_id), sensor_id);
    return buf;
}

ModuleCommands::ModuleCommands(CommandEngine& engine, Dispatcher& dispatcher, Logger& log,
                               std::chrono::milliseconds command_timeout,
                               std::chrono::milliseconds uplink_timeout)
    : engine_(engine), dispatcher_(dispatcher), log_(log),
      command_timeout_(command_timeout), uplink_timeout_(uplink_timeout) {}

// ---------------------------------------------------------------------------
// downlink()
// ----------
// The compact 19-byte response has no cmd field; only the full form can be
// checked against what was asked.
// ---------------------------------------------------------------------------
CommandResult ModuleCommands::downlink(uint64_t device_id, uint16_t sensor_id, uint8_t cmd,
                                       uint16_t order, const Bytes& data,
                                       std::chrono::milliseconds timeout) {
    const Bytes req = encode_downlink_request(device_id, sensor_id, cmd, order, data, unix_now());
    CommandResult r = engine_.execute(req, downlink_key(device_id, sensor_id), timeout);
    if (!r.success) return r;

    const auto* d = r.response ? std::get_if<DownlinkResponse>(&*r.response) : nullptr;
    if (!d) return CommandResult::fail(ErrorKind::Protocol, "unexpected response to downlink");
    if (d->form == DownlinkForm::Full && d->cmd != cmd) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "downlink response for cmd 0x%02X, expected 0x%02X", d->cmd, cmd);
        return CommandResult::fail(ErrorKind::Protocol, buf);
    }
    if (d->result != DOWNLINK_RESULT_SUCCESS) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "module returned 0x%02X (%s)", d->result,
                      downlink_result_text(d->result));
        CommandResult f = CommandResult::fail(ErrorKind::Device, buf);
        f.response = r.response;
        return f;
    }
    return r;
}

CommandResult ModuleCommands::with_uplink(uint64_t device_id, uint16_t request_sensor, uint8_t cmd,
                                          std::optional<uint16_t> uplink_sensor) {
    auto waiter = dispatcher_.expect_uplink(device_id, uplink_sensor);

    CommandResult r = downlink(device_id, request_sensor, cmd, 0, {}, command_timeout_);
    if (!r.success) {
        dispatcher_.cancel_uplink_waiter(waiter);
        return r;
    }

    log_.debug("module", "awaiting_uplink", id_fields(device_id, request_sensor) +
               " timeout_ms=" + std::to_string(uplink_timeout_.count()));
    if (waiter->future.wait_for(uplink_timeout_) != std::future_status::ready) {
        dispatcher_.cancel_uplink_waiter(waiter);
        // Delivered between the wait expiring and the cancel: still use it.
        if (waiter->future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
            return CommandResult::fail(ErrorKind::Timeout,
                                       "no uplink within " + std::to_string(uplink_timeout_.count()) + " ms");
    }
    return CommandResult::ok(Frame(waiter->future.get()));
}

CommandResult ModuleCommands::instant_uplink(uint64_t device_id, std::optional<uint16_t> sensor_id) {
    const uint16_t sensor = sensor_id.value_or(SENSOR_MAIN_UNIT);
    log_.info("module", "instant_uplink", id_fields(device_id, sensor));
    return with_uplink(device_id, sensor, MODULE_INSTANT_UPLINK, sensor_id);
}

CommandResult ModuleCommands::get_parameter(uint64_t device_id, Bytes& blob_out) {
    log_.info("module", "get_parameter", id_fields(device_id, SENSOR_MAIN_UNIT));
    CommandResult r = with_uplink(device_id, SENSOR_MAIN_UNIT, MODULE_GET_PARAMETER, SENSOR_MAIN_UNIT);
    if (r.success) {
        blob_out = std::get<UplinkNotification>(*r.response).payload;
        r.message = "parameter_bytes=" + std::to_string(blob_out.size());
    }
    return r;
}

CommandResult ModuleCommands::set_parameter(uint64_t device_id, uint16_t sensor_id, const Bytes& blob) {
    if (blob.empty()) return CommandResult::fail(ErrorKind::Invalid, "empty parameter blob");
    log_.info("module", "set_parameter",
              id_fields(device_id, sensor_id) + " bytes=" + std::to_string(blob.size()));
    return downlink(device_id, sensor_id, MODULE_SET_PARAMETER, 0, blob, command_timeout_);
}

CommandResult ModuleCommands::device_restart(uint64_t device_id) {
    log_.info("module", "device_restart", id_fields(device_id, SENSOR_MAIN_UNIT));
    return downlink(device_id, SENSOR_MAIN_UNIT, MODULE_DEVICE_RESTART, 0, {}, command_timeout_);
}

} // namespace bravejig
