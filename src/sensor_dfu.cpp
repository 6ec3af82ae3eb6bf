// ============================================================================
// sensor_dfu.cpp — sensor-module 4-block DFU (see dfu.hpp)
// ============================================================================

#include "bravejig/dfu.hpp"
#include "bravejig/byte_order.hpp"
#include "bravejig/firmware.hpp"
#include "bravejig/logger.hpp"
#include "bravejig/module.hpp"

#include <algorithm>
#include <cstdio>

namespace bravejig {

std::size_t sensor_continuation_count(std::size_t firmware_size) {
    if (firmware_size <= SENSOR_SECOND_BLOCK_FW) return 0;
    const std::size_t rest = firmware_size - SENSOR_SECOND_BLOCK_FW;
    // A rest that is an exact multiple of 238 leaves its last 238 bytes for the final block.
    return (rest - 1) / SENSOR_BLOCK_PAYLOAD;
}

std::size_t sensor_block_count(std::size_t firmware_size) {
    return 2 + sensor_continuation_count(firmware_size) + 1;
}

// ---------------------------------------------------------------------------
// plan_sensor_dfu()
// -----------------
// Everything is built before the first block goes out, so a bad image is
// rejected without touching the module.
// ---------------------------------------------------------------------------
bool plan_sensor_dfu(const Bytes& image, SensorDfuPlan& out, std::string& err) {
    if (image.empty()) { err = "firmware_empty"; return false; }

    bool stripped = false;
    const Bytes fw = strip_embedded_crc(image, stripped);
    if (fw.empty()) { err = "firmware_empty"; return false; }
    if (fw.size() > SENSOR_FIRMWARE_MAX) { err = "firmware_too_large"; return false; }

    out = SensorDfuPlan{};
    out.firmware_size = fw.size();
    out.crc_stripped = stripped;
    out.crc = crc32(fw);
    out.dfu_data_length = static_cast<uint32_t>(fw.size() + 4);

    const std::size_t cont = sensor_continuation_count(fw.size());
    out.blocks.reserve(3 + cont);

    // Header: hardware id, then 0xFF to 238 bytes.
    {
        SensorBlock b;
        b.seq = SEQ_HEADER;
        b.phase = "Header Block";
        b.payload.reserve(SENSOR_BLOCK_PAYLOAD);
        put_u16(b.payload, SENSOR_HARDWARE_ID);
        b.payload.resize(SENSOR_BLOCK_PAYLOAD, 0xFF);
        out.blocks.push_back(std::move(b));
    }

    // Second: dfuDataLength, first 234 image bytes, 0xFF padded.
    std::size_t off = std::min(SENSOR_SECOND_BLOCK_FW, fw.size());
    {
        SensorBlock b;
        b.seq = SEQ_SECOND;
        b.phase = "Second Block";
        b.payload.reserve(SENSOR_BLOCK_PAYLOAD);
        put_u32(b.payload, out.dfu_data_length);
        b.payload.insert(b.payload.end(), fw.begin(), fw.begin() + off);
        b.payload.resize(SENSOR_BLOCK_PAYLOAD, 0xFF);
        b.firmware_bytes = off;
        out.blocks.push_back(std::move(b));
    }

    for (std::size_t k = 0; k < cont; ++k) {
        SensorBlock b;
        b.seq = static_cast<uint16_t>(SEQ_FIRST_CONTINUATION + k);
        b.phase = "Continue Block " + std::to_string(k + 1);
        b.payload.assign(fw.begin() + off, fw.begin() + off + SENSOR_BLOCK_PAYLOAD);
        b.firmware_bytes = SENSOR_BLOCK_PAYLOAD;
        off += SENSOR_BLOCK_PAYLOAD;
        out.blocks.push_back(std::move(b));
    }

    // Final: whatever is left, then the CRC over the whole image.
    {
        SensorBlock b;
        b.seq = SEQ_FINAL;
        b.phase = "Final Block";
        b.payload.assign(fw.begin() + off, fw.end());
        b.firmware_bytes = fw.size() - off;
        put_u32(b.payload, out.crc);
        out.blocks.push_back(std::move(b));
    }
    return true;
}

SensorDfu::SensorDfu(ModuleCommands& modules, ErrorTracker& tracker, Logger& log, SensorDfuOptions opt)
    : modules_(modules), tracker_(tracker), log_(log), opt_(opt) {}

DfuReport SensorDfu::run(uint64_t device_id, uint16_t sensor_id, const FirmwareSource& fw,
                         const ProgressCallback& progress) {
    DfuReport rep;
    rep.total_bytes = fw.size();

    DfuState cur;
    if (!claim_dfu(state_, cur)) {
        rep.kind = ErrorKind::Dfu;
        rep.cause = ErrorKind::Busy;
        rep.state = cur;
        rep.message = "sensor DFU already in progress";
        return rep;
    }

    SensorDfuPlan plan;
    std::string err;
    if (!plan_sensor_dfu(fw.bytes(), plan, err)) {
        state_ = DfuState::Failed;
        rep.kind = ErrorKind::Dfu;
        rep.cause = ErrorKind::Invalid;
        rep.state = DfuState::Failed;
        rep.message = err;
        return rep;
    }
    rep.total_blocks = plan.blocks.size();
    rep.total_bytes = plan.firmware_size;
    rep.crc = plan.crc;

    char ids[64];
    std::snprintf(ids, sizeof(ids), "device_id=%016llX sensor_id=0x%04X",
                  static_cast<unsigned long long>(device_id), sensor_id);
    char crc_hex[16];
    std::snprintf(crc_hex, sizeof(crc_hex), "0x%08X", plan.crc);
    log_.info("sensor_dfu", "starting",
              std::string(ids) + " bytes=" + std::to_string(plan.firmware_size) +
              " blocks=" + std::to_string(rep.total_blocks) + " crc=" + crc_hex +
              " crc_stripped=" + (plan.crc_stripped ? "yes" : "no"));

    tracker_.start_dfu_tracking();
    state_ = DfuState::Transferring;

    DfuState final_state = DfuState::Completed;
    for (std::size_t i = 0; i < plan.blocks.size(); ++i) {
        const SensorBlock& b = plan.blocks[i];
        CommandResult r = modules_.downlink(device_id, sensor_id, MODULE_SENSOR_DFU, b.seq,
                                            b.payload, opt_.block_timeout);
        if (!r.success) {
            rep.cause = r.kind;
            rep.message = b.phase + " failed: " + to_string(r.kind) + ": " + r.message;
            final_state = DfuState::Failed;
            break;
        }
        auto errs = tracker_.dfu_errors();
        if (!errs.empty()) {
            rep.cause = ErrorKind::Device;
            rep.message = "router error during " + b.phase + ": " + errs.back().reason_text;
            final_state = DfuState::Failed;
            break;
        }

        rep.blocks_completed = i + 1;
        rep.bytes_transferred += b.firmware_bytes;
        log_.debug("sensor_dfu", "block_ok", "phase=\"" + b.phase + "\" seq=" + std::to_string(b.seq));
        if (progress) progress(rep.blocks_completed, rep.total_blocks, b.phase);
    }

    rep.dfu_errors = tracker_.stop_dfu_tracking();
    rep.state = final_state;
    rep.success = final_state == DfuState::Completed;
    state_ = final_state;

    const std::string fields = std::string(ids) + " blocks=" + std::to_string(rep.blocks_completed) +
                               "/" + std::to_string(rep.total_blocks);
    if (rep.success) {
        rep.message = "sensor firmware transferred; module restarts by itself";
        log_.info("sensor_dfu", "completed", fields);
    } else {
        rep.kind = ErrorKind::Dfu;
        log_.error("sensor_dfu", "failed", fields + " message=\"" + rep.message + "\"");
    }
    return rep;
}

} // namespace bravejig
