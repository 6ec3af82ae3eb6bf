// ============================================================================
// router_dfu.cpp — router 2-phase DFU (see dfu.hpp)
// ============================================================================

#include "bravejig/dfu.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/command_engine.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/firmware.hpp"
#include "bravejig/logger.hpp"

#include <algorithm>
#include <cstdio>

namespace bravejig {

const char* to_string(DfuState s) {
    switch (s) {
        case DfuState::Idle:         return "idle";
        case DfuState::Initiating:   return "initiating";
        case DfuState::Transferring: return "transferring";
        case DfuState::Completed:    return "completed";
        case DfuState::Failed:       return "failed";
    }
    return "unknown";
}

bool claim_dfu(std::atomic<DfuState>& state, DfuState& seen) {
    seen = state.load();
    while (seen != DfuState::Initiating && seen != DfuState::Transferring) {
        if (state.compare_exchange_weak(seen, DfuState::Initiating)) return true;
    }
    return false;
}

std::size_t router_chunk_count(std::size_t firmware_size) {
    return (firmware_size + ROUTER_DFU_CHUNK_MAX - 1) / ROUTER_DFU_CHUNK_MAX;
}

RouterDfu::RouterDfu(CommandEngine& engine, ErrorTracker& tracker, Logger& log, RouterDfuOptions opt)
    : engine_(engine), tracker_(tracker), log_(log), opt_(opt) {}

// ---------------------------------------------------------------------------
// A reply on dfu_response counts only if it is a DfuResponse with result
// 0x01; fills rep and returns false otherwise.
// ---------------------------------------------------------------------------
static bool dfu_accepted(const CommandResult& r, const std::string& step, DfuReport& rep) {
    if (!r.success) {
        rep.cause = r.kind;
        rep.message = step + " failed: " + to_string(r.kind) + ": " + r.message;
        return false;
    }
    const auto* d = r.response ? std::get_if<DfuResponse>(&*r.response) : nullptr;
    if (!d) {
        rep.cause = ErrorKind::Protocol;
        rep.message = step + " failed: unexpected response kind";
        return false;
    }
    if (d->result != DFU_RESULT_READY) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%02X", d->result);
        rep.cause = ErrorKind::Device;
        rep.message = step + " rejected by router (result " + buf + ")";
        return false;
    }
    return true;
}

DfuReport RouterDfu::finish(DfuReport& rep, DfuState final_state) {
    auto late = tracker_.stop_dfu_tracking();
    rep.dfu_errors.insert(rep.dfu_errors.end(), late.begin(), late.end());
    rep.state = final_state;
    rep.success = final_state == DfuState::Completed;
    if (!rep.success) rep.kind = ErrorKind::Dfu;
    state_ = final_state;

    const std::string fields = "chunks=" + std::to_string(rep.blocks_completed) + "/" +
                               std::to_string(rep.total_blocks) +
                               " bytes=" + std::to_string(rep.bytes_transferred) + "/" +
                               std::to_string(rep.total_bytes);
    if (rep.success) log_.info("router_dfu", "completed", fields);
    else             log_.error("router_dfu", "failed", fields + " message=\"" + rep.message + "\"");
    return rep;
}

DfuReport RouterDfu::run(const FirmwareSource& fw, const ProgressCallback& progress) {
    DfuReport rep;
    rep.total_bytes = fw.size();
    rep.total_blocks = router_chunk_count(fw.size());

    DfuState cur;
    if (!claim_dfu(state_, cur)) {
        rep.kind = ErrorKind::Dfu;
        rep.cause = ErrorKind::Busy;
        rep.state = cur;
        rep.message = "router DFU already in progress";
        return rep;
    }
    if (fw.size() == 0 || fw.size() > ROUTER_FIRMWARE_MAX) {
        state_ = DfuState::Failed;
        rep.kind = ErrorKind::Dfu;
        rep.cause = ErrorKind::Invalid;
        rep.state = DfuState::Failed;
        rep.message = fw.size() == 0 ? "firmware_empty" : "firmware_too_large";
        return rep;
    }

    // ---- phase 1: initiate ----
    tracker_.start_dfu_tracking();
    log_.info("router_dfu", "initiating",
              "bytes=" + std::to_string(fw.size()) + " chunks=" + std::to_string(rep.total_blocks));

    CommandResult init = engine_.execute(encode_dfu_request(static_cast<uint32_t>(fw.size()), unix_now()),
                                         DFU_RESPONSE_KEY, opt_.init_timeout);
    if (!dfu_accepted(init, "DFU initiation", rep)) return finish(rep, DfuState::Failed);

    // ---- phase 2: chunk transfer, one outstanding chunk at a time ----
    state_ = DfuState::Transferring;
    const Bytes& image = fw.bytes();
    for (std::size_t i = 0; i < rep.total_blocks; ++i) {
        const std::size_t off = i * ROUTER_DFU_CHUNK_MAX;
        const std::size_t n = std::min(ROUTER_DFU_CHUNK_MAX, image.size() - off);
        const std::string step = "chunk " + std::to_string(i + 1) + "/" + std::to_string(rep.total_blocks);

        CommandResult r = engine_.execute(encode_dfu_chunk(image.data() + off, n),
                                          DFU_RESPONSE_KEY, opt_.chunk_timeout);
        if (!dfu_accepted(r, step, rep)) return finish(rep, DfuState::Failed);

        rep.blocks_completed = i + 1;
        rep.bytes_transferred += n;
        log_.debug("router_dfu", "chunk_ok", "chunk=" + std::to_string(i + 1) + " len=" + std::to_string(n));
        if (progress) progress(rep.blocks_completed, rep.total_blocks, "Chunk Transfer");

        auto errs = tracker_.dfu_errors();
        if (!errs.empty()) {
            rep.cause = ErrorKind::Device;
            rep.message = "router error during " + step + ": " + errs.back().reason_text;
            return finish(rep, DfuState::Failed);
        }
    }

    // ---- completion: errors may still trail the last acknowledgment ----
    log_.info("router_dfu", "settling", "ms=" + std::to_string(opt_.settle.count()));
    if (tracker_.wait_for_dfu_error(opt_.settle)) {
        auto errs = tracker_.dfu_errors();
        rep.cause = ErrorKind::Device;
        rep.message = "router reported an error after transfer: " +
                      (errs.empty() ? std::string("unknown") : errs.back().reason_text);
        return finish(rep, DfuState::Failed);
    }
    rep.message = "router firmware transferred";
    return finish(rep, DfuState::Completed);
}

} // namespace bravejig
