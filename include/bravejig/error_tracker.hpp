#pragma once
/**
 * @file error_tracker.hpp
 * @brief Passive sink for router error notifications, with a DFU-scoped side list.
 *
 * @details
 * Error notifications carry no request key, so they cannot always be tied to
 * an outstanding command. The tracker keeps every one of them (bounded
 * history) and, while a DFU session brackets it with start/stop, mirrors
 * them into a second list so the DFU engine notices failures that arrive
 * asynchronously instead of as a failed block response.
 *
 * Records are appended and never mutated. The tracker never fails.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "bravejig/packets.hpp"

namespace bravejig {

class Logger;

struct ErrorRecord {
    uint64_t timestamp_ms{0};     ///< host wall clock when observed
    uint32_t device_time{0};      ///< unix_time carried in the notification
    uint8_t  packet_type{0};
    uint8_t  reason_code{0};
    std::string type_name;
    std::string reason_text;
    std::string context;
};

struct ErrorSummary {
    std::size_t total_errors{0};
    std::map<std::string, std::size_t> by_type;
    std::vector<ErrorRecord> recent;   ///< last RECENT_COUNT records, oldest first
    std::size_t dfu_errors{0};
};

class ErrorTracker {
public:
    static constexpr std::size_t DEFAULT_HISTORY = 1000;
    static constexpr std::size_t RECENT_COUNT    = 5;

    explicit ErrorTracker(Logger& log, std::size_t history_cap = DEFAULT_HISTORY);

    /// Append one notification. context names what was in flight, if anything.
    void record(const ErrorNotification& e, const std::string& context);

    /// Clear the DFU list and start mirroring into it.
    void start_dfu_tracking();

    /// Stop mirroring; return and clear what accumulated.
    std::vector<ErrorRecord> stop_dfu_tracking();

    bool dfu_tracking_active() const;
    std::vector<ErrorRecord> dfu_errors() const;

    /// Wait until at least one DFU-scoped error exists; false on timeout.
    bool wait_for_dfu_error(std::chrono::milliseconds timeout);

    std::vector<ErrorRecord> history() const;
    std::size_t count() const;
    ErrorSummary summary() const;
    void clear();

private:
    Logger& log_;
    const std::size_t history_cap_;

    mutable std::mutex mutex_;
    std::condition_variable dfu_cv_;
    std::deque<ErrorRecord> history_;
    std::size_t total_{0};
    std::map<std::string, std::size_t> by_type_;
    std::vector<ErrorRecord> dfu_;
    bool dfu_active_{false};
};

} // namespace bravejig
