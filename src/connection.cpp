// ============================================================================
// connection.cpp — implementation for connection.hpp
// ============================================================================

#include "bravejig/connection.hpp"

namespace bravejig {

using std::chrono::milliseconds;

Connection::Connection(const Config& cfg, std::unique_ptr<transport::ISerialPort> port,
                       std::ostream& log_out)
    : cfg_(cfg),
      log_(log_out, cfg.log_level),
      pool_(static_cast<std::size_t>(cfg.worker_threads), log_),
      transport_(std::move(port), pool_, log_),
      tracker_(log_),
      dispatcher_(table_, tracker_, log_),
      engine_(transport_, table_, log_),
      router_(engine_, log_, milliseconds(cfg.command_timeout_ms)),
      modules_(engine_, dispatcher_, log_, milliseconds(cfg.command_timeout_ms),
               milliseconds(cfg.uplink_timeout_ms)),
      router_dfu_(engine_, tracker_, log_,
                  RouterDfuOptions{milliseconds(cfg.dfu_init_timeout_ms),
                                   milliseconds(cfg.dfu_chunk_timeout_ms),
                                   milliseconds(cfg.dfu_settle_ms)}),
      sensor_dfu_(modules_, tracker_, log_, SensorDfuOptions{milliseconds(cfg.dfu_block_timeout_ms)}) {
    transport_.set_data_callback([this](const Bytes& frame) { dispatcher_.on_frame(frame); });

    transport_.set_error_callback([this](transport::TransportError e, const std::string& what) {
        if (e != transport::TransportError::Read) return;
        // The reader is gone; nothing pending can be answered any more.
        const std::size_t n = table_.cancel_all(ErrorKind::Disconnected, "link lost: " + what);
        if (n) log_.warn("connection", "cancelled_pending", "count=" + std::to_string(n));
    });

    transport_.set_connection_callback([this](bool up) {
        log_.debug("connection", up ? "link_up" : "link_down");
    });
}

Connection::~Connection() {
    close();
    pool_.shutdown();
}

bool Connection::open(std::string& err) {
    pool_.start();

    transport::PortConfig pc;
    pc.path = cfg_.port;
    pc.baud = cfg_.baud;
    if (!transport_.connect(pc, err)) return false;
    if (!transport_.start_monitoring()) {
        transport_.disconnect();
        err = "start_monitoring_failed";
        return false;
    }
    return true;
}

void Connection::close() {
    std::size_t n = table_.cancel_all(ErrorKind::Disconnected, "connection closed");
    transport_.disconnect();
    // Anything registered while the loops were stopping.
    n += table_.cancel_all(ErrorKind::Disconnected, "connection closed");
    if (n) log_.info("connection", "cancelled_pending", "count=" + std::to_string(n));
}

bool Connection::is_open() const { return transport_.is_monitoring(); }

} // namespace bravejig
