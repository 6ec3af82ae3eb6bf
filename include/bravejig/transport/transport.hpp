#pragma once
/**
 * @page bj-transport BraveJIG Transport
 * @file transport.hpp
 * @brief Owns the serial port; runs one reader and one writer thread; no protocol knowledge.
 *
 * @details
 * STATE MACHINE
 * -------------
 *   Disconnected --connect()--> Connected --start_monitoring()--> Monitoring
 *   Monitoring --stop_monitoring()--> Connected --disconnect()--> Disconnected
 *   disconnect() from Monitoring stops both loops first.
 *
 * THREADS
 * -------
 * - Reader: waits for input (poll with a short timeout so stop is noticed),
 *   reads what is available and hands each buffer to the data callback on
 *   the WorkerPool. A read error ends the loop and is reported once; it
 *   also stops the writer and marks the link lost, so is_monitoring() and
 *   send() reject from then on. disconnect() still joins both threads.
 * - Writer: pops frames off a bounded FIFO (ETL fixed-capacity deque) with a
 *   100 ms wait, writes and drains each one on its own. A write error is
 *   reported but the loop keeps going; later frames may still succeed.
 *
 * Each received buffer is one inbound frame; the router never coalesces.
 *
 * CALLBACKS
 * ---------
 * Data, error and connection callbacks all run on the WorkerPool, never on
 * the reader or writer thread. A data callback owns its buffer copy.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "etl/deque.h"

#include "bravejig/packets.hpp"
#include "bravejig/transport/serial_port.hpp"

namespace bravejig {

class Logger;
class WorkerPool;

namespace transport {

enum class TransportState : uint8_t { Disconnected, Connected, Monitoring };

const char* to_string(TransportState s);

enum class TransportError : uint8_t {
    Read,        ///< reader loop ended
    Write,       ///< one frame failed to write; writer keeps going
    QueueFull    ///< send() rejected a frame
};

struct TransportStats {
    uint64_t bytes_received{0};
    uint64_t bytes_sent{0};
    uint64_t frames_received{0};
    uint64_t frames_sent{0};
    uint64_t write_errors{0};
    uint64_t connection_attempts{0};
};

using DataCallback       = std::function<void(const Bytes&)>;
using ErrorCallback      = std::function<void(TransportError, const std::string&)>;
using ConnectionCallback = std::function<void(bool connected)>;

class Transport {
public:
    static constexpr std::size_t SEND_QUEUE_CAP = 64;
    static constexpr std::size_t READ_CHUNK     = 4096;
    static constexpr int         READ_POLL_MS   = 10;
    static constexpr int         WRITE_POLL_MS  = 100;

    Transport(std::unique_ptr<ISerialPort> port, WorkerPool& pool, Logger& log);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    bool connect(const PortConfig& cfg, std::string& err);
    bool start_monitoring();
    void stop_monitoring();
    void disconnect();

    /// Queue one frame for the writer. false unless Monitoring, or when the queue is full.
    bool send(const Bytes& frame);

    TransportState state() const;
    bool is_connected() const;
    bool is_monitoring() const;
    /// true once the reader has ended on a read error; cleared by start_monitoring().
    bool link_lost() const;

    void set_data_callback(DataCallback cb);
    void set_error_callback(ErrorCallback cb);
    void set_connection_callback(ConnectionCallback cb);

    TransportStats statistics() const;
    const std::string& port_path() const { return cfg_.path; }

private:
    void reader_loop();
    void writer_loop();
    void report_error(TransportError e, const std::string& what);
    void report_connection(bool up);

    std::unique_ptr<ISerialPort> port_;
    WorkerPool& pool_;
    Logger& log_;
    PortConfig cfg_;

    mutable std::mutex state_mutex_;
    TransportState state_{TransportState::Disconnected};

    std::atomic<bool> stop_{false};
    std::atomic<bool> lost_{false};
    std::thread reader_;
    std::thread writer_;

    std::mutex send_mutex_;
    std::condition_variable send_cv_;
    etl::deque<Bytes, SEND_QUEUE_CAP> send_queue_;

    mutable std::mutex cb_mutex_;
    DataCallback on_data_;
    ErrorCallback on_error_;
    ConnectionCallback on_connection_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

} // namespace transport
} // namespace bravejig
