#pragma once
/**
 * @page bj-correlation BraveJIG Correlation Table
 * @file correlation.hpp
 * @brief Pending-request map: at most one outstanding request per key.
 *
 * @details
 * The router answers one request at a time and echoes no request id, so a
 * reply is matched to its caller by a key derived from the command family:
 *
 *   jig_info_<cmd>                  JIG-Info, cmd in decimal
 *   downlink_<device_id>_<sensor_id> Downlink, both in decimal
 *   dfu_response                    router DFU initiation and every chunk
 *
 * A PendingRequest is a one-shot channel (promise/future). Whoever removes it
 * from the map first (resolve, fail, cancel_all, or the timed-out caller)
 * is the only one allowed to complete it; the rest find nothing and drop.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bravejig/result.hpp"

namespace bravejig {

constexpr const char* DFU_RESPONSE_KEY = "dfu_response";

std::string jig_info_key(uint8_t cmd);
std::string downlink_key(uint64_t device_id, uint16_t sensor_id);

struct PendingRequest {
    std::string key;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::milliseconds timeout{0};
    std::promise<CommandResult> promise;
    std::future<CommandResult> future;
};

class CorrelationTable {
public:
    /// nullptr if a request with this key is already pending.
    std::shared_ptr<PendingRequest> add(const std::string& key, std::chrono::milliseconds timeout);

    /// Complete the pending request for key with a response. false if none (late reply).
    bool resolve(const std::string& key, Frame response);

    /// Complete the pending request for key with an error. false if none.
    bool fail(const std::string& key, ErrorKind kind, const std::string& message);

    /// If exactly one request is pending, fail it and report its key.
    bool fail_single(ErrorKind kind, const std::string& message, std::string& key_out);

    /// Fail every pending request; returns how many were cancelled.
    std::size_t cancel_all(ErrorKind kind, const std::string& message);

    /// Remove p only if it is still the entry for its key. false if someone completed it first.
    bool remove(const std::shared_ptr<PendingRequest>& p);

    std::size_t size() const;
    std::vector<std::string> keys() const;

private:
    std::shared_ptr<PendingRequest> take(const std::string& key);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PendingRequest>> pending_;
};

} // namespace bravejig
