// ============================================================================
// error_tracker.cpp — implementation for error_tracker.hpp
// ============================================================================

#include "bravejig/error_tracker.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/logger.hpp"

#include <algorithm>
#include <cstdio>

namespace bravejig {

static uint64_t now_ms_system() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

ErrorTracker::ErrorTracker(Logger& log, std::size_t history_cap)
    : log_(log), history_cap_(history_cap == 0 ? 1 : history_cap) {}

// ---------------------------------------------------------------------------
// record()
// --------
// history_ is bounded (oldest dropped) but total_ and by_type_ keep counting,
// so summary() stays accurate over long monitor sessions.
// ---------------------------------------------------------------------------
void ErrorTracker::record(const ErrorNotification& e, const std::string& context) {
    ErrorRecord r;
    r.timestamp_ms = now_ms_system();
    r.device_time  = e.unix_time;
    r.packet_type  = e.type;
    r.reason_code  = e.reason;
    r.type_name    = error_type_name(e.type);
    r.reason_text  = interpret_error_reason(e.reason);
    r.context      = context;

    char code[8];
    std::snprintf(code, sizeof(code), "0x%02X", e.reason);
    std::string fields = "type=\"" + r.type_name + "\" reason=" + code +
                         " reason_text=\"" + r.reason_text + "\"";
    if (!context.empty()) fields += " context=" + context;

    bool dfu = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        history_.push_back(r);
        if (history_.size() > history_cap_) history_.pop_front();
        ++total_;
        ++by_type_[r.type_name];
        if (dfu_active_) {
            dfu_.push_back(r);
            dfu = true;
        }
    }

    if (dfu) {
        dfu_cv_.notify_all();
        log_.error("errors", "dfu_error_detected", fields);
    } else {
        log_.error("errors", "router_error", fields);
    }
}

void ErrorTracker::start_dfu_tracking() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        dfu_.clear();
        dfu_active_ = true;
    }
    log_.info("errors", "dfu_tracking_started");
}

std::vector<ErrorRecord> ErrorTracker::stop_dfu_tracking() {
    std::vector<ErrorRecord> out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        dfu_active_ = false;
        out.swap(dfu_);
    }
    log_.info("errors", "dfu_tracking_stopped", "errors=" + std::to_string(out.size()));
    return out;
}

bool ErrorTracker::dfu_tracking_active() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dfu_active_;
}

std::vector<ErrorRecord> ErrorTracker::dfu_errors() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dfu_;
}

bool ErrorTracker::wait_for_dfu_error(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return dfu_cv_.wait_for(lk, timeout, [this] { return !dfu_.empty(); });
}

std::vector<ErrorRecord> ErrorTracker::history() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::vector<ErrorRecord>(history_.begin(), history_.end());
}

std::size_t ErrorTracker::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return total_;
}

ErrorSummary ErrorTracker::summary() const {
    std::lock_guard<std::mutex> lk(mutex_);
    ErrorSummary s;
    s.total_errors = total_;
    s.by_type = by_type_;
    s.dfu_errors = dfu_.size();
    const std::size_t n = std::min(RECENT_COUNT, history_.size());
    s.recent.assign(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
    return s;
}

void ErrorTracker::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    history_.clear();
    by_type_.clear();
    total_ = 0;
    dfu_.clear();
}

} // namespace bravejig
