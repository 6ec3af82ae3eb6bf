// ============================================================================
// transport.cpp — implementation for transport/transport.hpp
// ============================================================================

#include "bravejig/transport/transport.hpp"
#include "bravejig/codec.hpp"
#include "bravejig/logger.hpp"
#include "bravejig/worker_pool.hpp"

#include <chrono>

namespace bravejig::transport {

const char* to_string(TransportState s) {
    switch (s) {
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Connected:    return "connected";
        case TransportState::Monitoring:   return "monitoring";
    }
    return "unknown";
}

Transport::Transport(std::unique_ptr<ISerialPort> port, WorkerPool& pool, Logger& log)
    : port_(std::move(port)), pool_(pool), log_(log) {}

Transport::~Transport() { disconnect(); }

// ---------------------------------------------------------------------------
// connect()
// ---------
// Disconnected -> Connected. Counts every attempt, successful or not.
// ---------------------------------------------------------------------------
bool Transport::connect(const PortConfig& cfg, std::string& err) {
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (state_ != TransportState::Disconnected) { err = "already_connected"; return false; }

    {
        std::lock_guard<std::mutex> sk(stats_mutex_);
        ++stats_.connection_attempts;
    }

    if (!port_->open(cfg, err)) {
        log_.error("transport", "connect_failed", "port=" + cfg.path + " reason=" + err);
        return false;
    }
    cfg_ = cfg;
    state_ = TransportState::Connected;
    log_.info("transport", "connected",
              "port=" + cfg.path + " baud=" + std::to_string(cfg.baud) + " impl=" + port_->name());
    report_connection(true);
    return true;
}

bool Transport::start_monitoring() {
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (state_ == TransportState::Monitoring) return true;
    if (state_ != TransportState::Connected) {
        log_.warn("transport", "start_monitoring_rejected", "state=" + std::string(to_string(state_)));
        return false;
    }
    stop_ = false;
    lost_ = false;
    reader_ = std::thread(&Transport::reader_loop, this);
    writer_ = std::thread(&Transport::writer_loop, this);
    state_ = TransportState::Monitoring;
    log_.debug("transport", "monitoring_started");
    return true;
}

void Transport::stop_monitoring() {
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (state_ != TransportState::Monitoring) return;

    stop_ = true;
    send_cv_.notify_all();
    if (reader_.joinable()) reader_.join();
    if (writer_.joinable()) writer_.join();

    {
        std::lock_guard<std::mutex> sk(send_mutex_);
        if (!send_queue_.empty())
            log_.warn("transport", "dropped_unsent", "frames=" + std::to_string(send_queue_.size()));
        send_queue_.clear();
    }
    state_ = TransportState::Connected;
    log_.debug("transport", "monitoring_stopped");
}

void Transport::disconnect() {
    stop_monitoring();
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (state_ == TransportState::Disconnected) return;
    port_->close();
    state_ = TransportState::Disconnected;
    log_.info("transport", "disconnected", "port=" + cfg_.path);
    report_connection(false);
}

// ---------------------------------------------------------------------------
// send()
// ------
// Never blocks on the wire: the frame is copied into the bounded queue and
// the writer thread does the rest.
// ---------------------------------------------------------------------------
bool Transport::send(const Bytes& frame) {
    if (!is_monitoring()) {
        log_.warn("transport", "send_rejected", "reason=not_monitoring");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(send_mutex_);
        if (send_queue_.full()) {
            log_.error("transport", "send_queue_full", "cap=" + std::to_string(SEND_QUEUE_CAP));
            report_error(TransportError::QueueFull, "send queue full");
            return false;
        }
        send_queue_.push_back(frame);
    }
    send_cv_.notify_one();
    return true;
}

TransportState Transport::state() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return state_;
}

bool Transport::is_connected() const {
    return state() != TransportState::Disconnected;
}

bool Transport::is_monitoring() const {
    return state() == TransportState::Monitoring && !lost_;
}

bool Transport::link_lost() const {
    return lost_;
}

void Transport::set_data_callback(DataCallback cb) {
    std::lock_guard<std::mutex> lk(cb_mutex_);
    on_data_ = std::move(cb);
}

void Transport::set_error_callback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lk(cb_mutex_);
    on_error_ = std::move(cb);
}

void Transport::set_connection_callback(ConnectionCallback cb) {
    std::lock_guard<std::mutex> lk(cb_mutex_);
    on_connection_ = std::move(cb);
}

TransportStats Transport::statistics() const {
    std::lock_guard<std::mutex> lk(stats_mutex_);
    return stats_;
}

void Transport::report_error(TransportError e, const std::string& what) {
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lk(cb_mutex_);
        cb = on_error_;
    }
    if (cb && !pool_.submit([cb, e, what] { cb(e, what); }))
        log_.warn("transport", "error_callback_dropped", "what=\"" + what + "\"");
}

void Transport::report_connection(bool up) {
    ConnectionCallback cb;
    {
        std::lock_guard<std::mutex> lk(cb_mutex_);
        cb = on_connection_;
    }
    if (cb && !pool_.submit([cb, up] { cb(up); }))
        log_.warn("transport", "connection_callback_dropped", std::string("up=") + (up ? "1" : "0"));
}

// ---------------------------------------------------------------------------
// reader_loop()
// -------------
// poll() with a short timeout instead of a sleep so input is picked up as
// soon as it lands and stop_ is still noticed promptly.
// ---------------------------------------------------------------------------
void Transport::reader_loop() {
    uint8_t buf[READ_CHUNK];

    while (!stop_) {
        if (!port_->wait_readable(READ_POLL_MS)) continue;

        std::size_t want = port_->available();
        if (want == 0 || want > READ_CHUNK) want = READ_CHUNK;

        std::size_t n = 0;
        RxResult rr = port_->recv(buf, want, n);
        if (rr == RxResult::None) continue;
        if (rr == RxResult::Error) {
            // state_mutex_ may be held by stop_monitoring() joining this thread;
            // the flags alone take the link down, the join happens there.
            lost_ = true;
            stop_ = true;
            send_cv_.notify_all();
            log_.error("transport", "read_failed", "port=" + cfg_.path);
            report_error(TransportError::Read, "read failed on " + cfg_.path);
            report_connection(false);
            break;
        }

        Bytes frame(buf, buf + n);
        {
            std::lock_guard<std::mutex> lk(stats_mutex_);
            stats_.bytes_received += n;
            ++stats_.frames_received;
        }
        if (log_.enabled(LogLevel::Debug))
            log_.debug("transport", "rx", "len=" + std::to_string(n) + " hex=\"" + to_hex(frame) + "\"");

        DataCallback cb;
        {
            std::lock_guard<std::mutex> lk(cb_mutex_);
            cb = on_data_;
        }
        if (cb && !pool_.submit([cb, frame = std::move(frame)] { cb(frame); }))
            log_.warn("transport", "rx_dropped", "len=" + std::to_string(n));
    }
}

// ---------------------------------------------------------------------------
// writer_loop()
// -------------
// One frame per write+drain; no coalescing. Errors are reported and the
// loop continues.
// ---------------------------------------------------------------------------
void Transport::writer_loop() {
    while (true) {
        Bytes frame;
        {
            std::unique_lock<std::mutex> lk(send_mutex_);
            send_cv_.wait_for(lk, std::chrono::milliseconds(WRITE_POLL_MS),
                              [this] { return stop_ || !send_queue_.empty(); });
            if (stop_) break;
            if (send_queue_.empty()) continue;
            frame = std::move(send_queue_.front());
            send_queue_.pop_front();
        }

        TxResult tr = port_->send(frame.data(), frame.size());
        if (tr == TxResult::Ok) {
            std::lock_guard<std::mutex> lk(stats_mutex_);
            stats_.bytes_sent += frame.size();
            ++stats_.frames_sent;
        } else {
            {
                std::lock_guard<std::mutex> lk(stats_mutex_);
                ++stats_.write_errors;
            }
            const char* why = (tr == TxResult::Timeout) ? "timeout" : "error";
            log_.error("transport", "write_failed",
                       std::string("why=") + why + " len=" + std::to_string(frame.size()));
            report_error(TransportError::Write, std::string("write ") + why);
            continue;
        }
        if (log_.enabled(LogLevel::Debug))
            log_.debug("transport", "tx", "len=" + std::to_string(frame.size()) + " hex=\"" + to_hex(frame) + "\"");
    }
}

} // namespace bravejig::transport
