#pragma once
/**
 * @page bj-dispatcher BraveJIG Dispatcher
 * @file dispatcher.hpp
 * @brief Turns raw inbound buffers into routed, typed events.
 *
 * @details
 * ROUTING
 * -------
 *   classify_and_decode() fails    -> logged, counted, dropped
 *   UplinkNotification             -> one-shot uplink waiters, then consumers
 *   JigInfoResponse                -> resolve jig_info_<cmd>
 *   DownlinkResponse               -> resolve downlink_<device>_<sensor>
 *   DfuResponse                    -> resolve dfu_response
 *   ErrorNotification              -> ErrorTracker, and if exactly one request
 *                                     is pending it fails with the reason text
 *
 * A reply for a key nobody waits on (late after a timeout, or unsolicited)
 * is logged at debug and dropped. Nothing here ever reaches back into the
 * Transport, so decode problems never surface at send().
 *
 * on_frame() is the Transport's data callback and is called concurrently
 * from the worker pool; all state is behind mutexes.
 */

#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "bravejig/codec.hpp"
#include "bravejig/packets.hpp"

namespace bravejig {

class CorrelationTable;
class ErrorTracker;
class Logger;

/// One-shot wait for the next uplink from a device, optionally one sensor.
struct UplinkWaiter {
    uint64_t device_id{0};
    std::optional<uint16_t> sensor_id;
    std::promise<UplinkNotification> promise;
    std::future<UplinkNotification> future;
};

struct DispatchStats {
    uint64_t frames{0};
    uint64_t dropped{0};
    uint64_t resolved{0};
    uint64_t unmatched{0};
    uint64_t uplinks{0};
    uint64_t errors{0};
};

class Dispatcher {
public:
    using UplinkConsumer = std::function<void(const UplinkNotification&)>;
    using FrameObserver  = std::function<void(const Frame&)>;
    using DropObserver   = std::function<void(const Bytes&, DecodeError)>;

    Dispatcher(CorrelationTable& table, ErrorTracker& tracker, Logger& log);

    /// Entry point for every received buffer.
    void on_frame(const Bytes& raw);

    /// Long-lived uplink consumer; returns a handle for removal.
    int add_uplink_consumer(UplinkConsumer c);
    void remove_uplink_consumer(int handle);

    /// Register before sending the request that triggers the uplink.
    std::shared_ptr<UplinkWaiter> expect_uplink(uint64_t device_id,
                                                std::optional<uint16_t> sensor_id = std::nullopt);
    void cancel_uplink_waiter(const std::shared_ptr<UplinkWaiter>& w);

    /// Sees every decoded frame before routing (monitor output).
    void set_frame_observer(FrameObserver o);
    /// Sees every buffer that failed to decode.
    void set_drop_observer(DropObserver o);

    DispatchStats stats() const;

private:
    void route_uplink(const UplinkNotification& u);
    void route_reply(const std::string& key, Frame f);
    void route_error(const ErrorNotification& e);

    CorrelationTable& table_;
    ErrorTracker& tracker_;
    Logger& log_;

    mutable std::mutex mutex_;
    std::map<int, UplinkConsumer> consumers_;
    int next_handle_{1};
    std::list<std::shared_ptr<UplinkWaiter>> waiters_;
    FrameObserver frame_observer_;
    DropObserver drop_observer_;
    DispatchStats stats_;
};

} // namespace bravejig
