// ============================================================================
// dispatcher.cpp — implementation for dispatcher.hpp
// ============================================================================

#include "bravejig/dispatcher.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/error_tracker.hpp"
#include "bravejig/logger.hpp"

#include <vector>

namespace bravejig {

Dispatcher::Dispatcher(CorrelationTable& table, ErrorTracker& tracker, Logger& log)
    : table_(table), tracker_(tracker), log_(log) {}

// ---------------------------------------------------------------------------
// on_frame()
// ----------
// Decode once, notify the observer, then switch on the concrete kind.
// Observers are copied out of the lock before they run.
// ---------------------------------------------------------------------------
void Dispatcher::on_frame(const Bytes& raw) {
    Frame f;
    DecodeError err = DecodeError::None;
    const bool ok = classify_and_decode(raw, f, err);

    FrameObserver fo;
    DropObserver dob;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++stats_.frames;
        if (!ok) ++stats_.dropped;
        fo = frame_observer_;
        dob = drop_observer_;
    }

    if (!ok) {
        log_.warn("dispatch", "drop",
                  std::string("reason=") + to_string(err) + " len=" + std::to_string(raw.size()) +
                  " hex=\"" + to_hex(raw) + "\"");
        if (dob) dob(raw, err);
        return;
    }

    if (log_.enabled(LogLevel::Debug)) log_.debug("dispatch", "frame", describe(f));
    if (fo) fo(f);

    std::string key;
    if (auto* u = std::get_if<UplinkNotification>(&f)) {
        route_uplink(*u);
        return;
    }
    if (auto* e = std::get_if<ErrorNotification>(&f)) {
        route_error(*e);
        return;
    }
    if (auto* j = std::get_if<JigInfoResponse>(&f))       key = jig_info_key(j->cmd);
    else if (auto* d = std::get_if<DownlinkResponse>(&f)) key = downlink_key(d->device_id, d->sensor_id);
    else                                                  key = DFU_RESPONSE_KEY;
    route_reply(key, std::move(f));
}

// Uplinks never consume a PendingRequest.
void Dispatcher::route_uplink(const UplinkNotification& u) {
    std::shared_ptr<UplinkWaiter> hit;
    std::vector<UplinkConsumer> consumers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++stats_.uplinks;
        for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
            const auto& w = *it;
            if (w->device_id != u.device_id) continue;
            if (w->sensor_id && *w->sensor_id != u.sensor_id) continue;
            hit = w;
            waiters_.erase(it);
            break;
        }
        consumers.reserve(consumers_.size());
        for (const auto& kv : consumers_) consumers.push_back(kv.second);
    }
    if (hit) hit->promise.set_value(u);
    for (const auto& c : consumers) c(u);
}

void Dispatcher::route_reply(const std::string& key, Frame f) {
    const bool matched = table_.resolve(key, std::move(f));
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (matched) ++stats_.resolved;
        else         ++stats_.unmatched;
    }
    if (matched) log_.debug("dispatch", "resolved", "key=" + key);
    else         log_.debug("dispatch", "unmatched_reply", "key=" + key);
}

// ---------------------------------------------------------------------------
// route_error()
// -------------
// The router does not echo which request an error belongs to. With exactly
// one request in flight it can only be that one; with zero or several we
// only record it.
// ---------------------------------------------------------------------------
void Dispatcher::route_error(const ErrorNotification& e) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++stats_.errors;
    }

    auto keys = table_.keys();
    std::string context = keys.size() == 1 ? keys.front()
                        : keys.empty()     ? std::string("unsolicited")
                                           : std::string("ambiguous");
    tracker_.record(e, context);

    std::string failed;
    if (table_.fail_single(ErrorKind::Device,
                           std::string(error_type_name(e.type)) + ": " + interpret_error_reason(e.reason),
                           failed)) {
        log_.warn("dispatch", "request_failed_by_error", "key=" + failed);
    }
}

int Dispatcher::add_uplink_consumer(UplinkConsumer c) {
    std::lock_guard<std::mutex> lk(mutex_);
    const int h = next_handle_++;
    consumers_.emplace(h, std::move(c));
    return h;
}

void Dispatcher::remove_uplink_consumer(int handle) {
    std::lock_guard<std::mutex> lk(mutex_);
    consumers_.erase(handle);
}

std::shared_ptr<UplinkWaiter> Dispatcher::expect_uplink(uint64_t device_id,
                                                        std::optional<uint16_t> sensor_id) {
    auto w = std::make_shared<UplinkWaiter>();
    w->device_id = device_id;
    w->sensor_id = sensor_id;
    w->future = w->promise.get_future();
    std::lock_guard<std::mutex> lk(mutex_);
    waiters_.push_back(w);
    return w;
}

void Dispatcher::cancel_uplink_waiter(const std::shared_ptr<UplinkWaiter>& w) {
    std::lock_guard<std::mutex> lk(mutex_);
    waiters_.remove(w);
}

void Dispatcher::set_frame_observer(FrameObserver o) {
    std::lock_guard<std::mutex> lk(mutex_);
    frame_observer_ = std::move(o);
}

void Dispatcher::set_drop_observer(DropObserver o) {
    std::lock_guard<std::mutex> lk(mutex_);
    drop_observer_ = std::move(o);
}

DispatchStats Dispatcher::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stats_;
}

} // namespace bravejig
