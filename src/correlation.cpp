// ============================================================================
// correlation.cpp — implementation for correlation.hpp
// ============================================================================

#include "bravejig/correlation.hpp"

namespace bravejig {

std::string jig_info_key(uint8_t cmd) {
    return "jig_info_" + std::to_string(cmd);
}

std::string downlink_key(uint64_t device_id, uint16_t sensor_id) {
    return "downlink_" + std::to_string(device_id) + "_" + std::to_string(sensor_id);
}

std::shared_ptr<PendingRequest> CorrelationTable::add(const std::string& key,
                                                      std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (pending_.count(key)) return nullptr;

    auto p = std::make_shared<PendingRequest>();
    p->key = key;
    p->created_at = std::chrono::steady_clock::now();
    p->timeout = timeout;
    p->future = p->promise.get_future();
    pending_.emplace(key, p);
    return p;
}

// Erase under the lock; the caller completes the promise outside it.
std::shared_ptr<PendingRequest> CorrelationTable::take(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end()) return nullptr;
    auto p = it->second;
    pending_.erase(it);
    return p;
}

bool CorrelationTable::resolve(const std::string& key, Frame response) {
    auto p = take(key);
    if (!p) return false;
    p->promise.set_value(CommandResult::ok(std::move(response)));
    return true;
}

bool CorrelationTable::fail(const std::string& key, ErrorKind kind, const std::string& message) {
    auto p = take(key);
    if (!p) return false;
    p->promise.set_value(CommandResult::fail(kind, message));
    return true;
}

bool CorrelationTable::fail_single(ErrorKind kind, const std::string& message, std::string& key_out) {
    std::shared_ptr<PendingRequest> p;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (pending_.size() != 1) return false;
        p = pending_.begin()->second;
        pending_.clear();
    }
    key_out = p->key;
    p->promise.set_value(CommandResult::fail(kind, message));
    return true;
}

std::size_t CorrelationTable::cancel_all(ErrorKind kind, const std::string& message) {
    std::map<std::string, std::shared_ptr<PendingRequest>> victims;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        victims.swap(pending_);
    }
    for (auto& kv : victims)
        kv.second->promise.set_value(CommandResult::fail(kind, message));
    return victims.size();
}

bool CorrelationTable::remove(const std::shared_ptr<PendingRequest>& p) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = pending_.find(p->key);
    if (it == pending_.end() || it->second != p) return false;
    pending_.erase(it);
    return true;
}

std::size_t CorrelationTable::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

std::vector<std::string> CorrelationTable::keys() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> out;
    out.reserve(pending_.size());
    for (const auto& kv : pending_) out.push_back(kv.first);
    return out;
}

} // namespace bravejig
