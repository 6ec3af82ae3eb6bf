/**
 * @page bj-dfu BraveJIG Firmware Update Engines
 * @file dfu.hpp
 * @brief Router 2-phase chunked DFU and sensor-module 4-block DFU.
 *
 * @details
 * Two unrelated wire protocols share one report type and one state enum:
 *
 *   Idle -> Initiating -> Transferring -> Completed | Failed
 *
 * ROUTER (RouterDfu)
 * ------------------
 * 1. Initiating: DfuRequest{unix_time, total_length}; wait on dfu_response.
 *    result 0x01 means ready; anything else is a rejection.
 * 2. Transferring: firmware split into <=1024-byte chunks, each sent as
 *    [size u16][bytes] and acknowledged on dfu_response before the next.
 * 3. Settle: after the last chunk, watch the error tracker for a short
 *    window. A DFU-scoped error notification there fails the update.
 *
 * SENSOR MODULE (SensorDfu)
 * -------------------------
 * Downlink cmd 0x12 to (device, sensor); the order field carries the block
 * sequence number.
 *
 *   | seq            | phase            | payload                                   |
 *   |----------------|------------------|-------------------------------------------|
 *   | 0x0000         | Header Block     | hwID u16 (0x0000) + 236 x 0xFF            |
 *   | 0x0001         | Second Block     | dfuDataLength u32 (N+4) + fw[0..234), 0xFF padded |
 *   | 0x0002..0xFFFE | Continue Block k | 238 firmware bytes, only while >238 remain |
 *   | 0xFFFF         | Final Block      | remaining bytes + CRC32 LE                |
 *
 * N and the CRC exclude a CRC32 already appended to the image, if any.
 * After success the module restarts on its own; give it 30-60 s before
 * querying its parameters again.
 *
 * Neither engine retries. The first failed chunk or block aborts the whole
 * transfer and the report says how far it got.
 */
#ifndef BRAVEJIG_DFU_HPP
#define BRAVEJIG_DFU_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "bravejig/error_tracker.hpp"
#include "bravejig/packets.hpp"
#include "bravejig/result.hpp"

namespace bravejig {

class CommandEngine;
class FirmwareSource;
class Logger;
class ModuleCommands;

enum class DfuState : uint8_t { Idle, Initiating, Transferring, Completed, Failed };

const char* to_string(DfuState s);

/// Atomically moves an idle or finished engine to Initiating. On false,
/// `seen` holds the in-progress state that blocked the claim.
bool claim_dfu(std::atomic<DfuState>& state, DfuState& seen);

struct DfuReport {
    bool success{false};
    ErrorKind kind{ErrorKind::None};    ///< Dfu on any failure
    ErrorKind cause{ErrorKind::None};   ///< what the failing step reported
    std::string message;
    DfuState state{DfuState::Idle};
    std::size_t blocks_completed{0};    ///< chunks for the router, blocks for a sensor
    std::size_t total_blocks{0};
    std::size_t bytes_transferred{0};   ///< firmware bytes acknowledged so far
    std::size_t total_bytes{0};
    uint32_t crc{0};                    ///< sensor only
    std::vector<ErrorRecord> dfu_errors;
};

/// Called after every acknowledged chunk/block.
using ProgressCallback = std::function<void(std::size_t current, std::size_t total,
                                            const std::string& phase)>;

// ================================ Router ==================================

constexpr std::size_t ROUTER_FIRMWARE_MAX = 16u * 1024u * 1024u;

/// ceil(n / 1024)
std::size_t router_chunk_count(std::size_t firmware_size);

struct RouterDfuOptions {
    std::chrono::milliseconds init_timeout{10000};
    std::chrono::milliseconds chunk_timeout{10000};
    std::chrono::milliseconds settle{2000};
};

class RouterDfu {
public:
    RouterDfu(CommandEngine& engine, ErrorTracker& tracker, Logger& log, RouterDfuOptions opt = {});

    DfuReport run(const FirmwareSource& fw, const ProgressCallback& progress = {});
    DfuState state() const { return state_.load(); }

private:
    DfuReport finish(DfuReport& rep, DfuState final_state);

    CommandEngine& engine_;
    ErrorTracker& tracker_;
    Logger& log_;
    RouterDfuOptions opt_;
    std::atomic<DfuState> state_{DfuState::Idle};
};

// ================================ Sensor ==================================

constexpr std::size_t SENSOR_BLOCK_PAYLOAD    = 238;
constexpr std::size_t SENSOR_SECOND_BLOCK_FW  = 234;
constexpr uint16_t    SENSOR_HARDWARE_ID      = 0x0000;
constexpr uint16_t    SEQ_HEADER              = 0x0000;
constexpr uint16_t    SEQ_SECOND              = 0x0001;
constexpr uint16_t    SEQ_FIRST_CONTINUATION  = 0x0002;
constexpr uint16_t    SEQ_LAST_CONTINUATION   = 0xFFFE;
constexpr uint16_t    SEQ_FINAL               = 0xFFFF;

/// Largest image (after CRC stripping) whose continuation blocks fit in 0x0002..0xFFFE.
constexpr std::size_t SENSOR_FIRMWARE_MAX =
    SENSOR_SECOND_BLOCK_FW + SENSOR_BLOCK_PAYLOAD * (SEQ_LAST_CONTINUATION - SEQ_FIRST_CONTINUATION + 2);

/// Continuation blocks for an n-byte image: none when the rest fits the final block.
std::size_t sensor_continuation_count(std::size_t firmware_size);

/// 2 + continuation + 1
std::size_t sensor_block_count(std::size_t firmware_size);

struct SensorBlock {
    uint16_t seq{0};
    std::string phase;
    Bytes payload;
    std::size_t firmware_bytes{0};   ///< image bytes carried, padding and CRC excluded
};

struct SensorDfuPlan {
    std::vector<SensorBlock> blocks;
    std::size_t firmware_size{0};    ///< N, after stripping an embedded CRC
    bool crc_stripped{false};
    uint32_t crc{0};
    uint32_t dfu_data_length{0};     ///< N + 4
};

/// Build every block up front. err: firmware_empty | firmware_too_large
bool plan_sensor_dfu(const Bytes& image, SensorDfuPlan& out, std::string& err);

struct SensorDfuOptions {
    std::chrono::milliseconds block_timeout{10000};
};

class SensorDfu {
public:
    SensorDfu(ModuleCommands& modules, ErrorTracker& tracker, Logger& log, SensorDfuOptions opt = {});

    DfuReport run(uint64_t device_id, uint16_t sensor_id, const FirmwareSource& fw,
                  const ProgressCallback& progress = {});
    DfuState state() const { return state_.load(); }

private:
    ModuleCommands& modules_;
    ErrorTracker& tracker_;
    Logger& log_;
    SensorDfuOptions opt_;
    std::atomic<DfuState> state_{DfuState::Idle};
};

} // namespace bravejig

#endif // BRAVEJIG_DFU_HPP
