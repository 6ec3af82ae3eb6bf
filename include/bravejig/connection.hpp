#pragma once
/**
 * @page bj-connection BraveJIG Connection
 * @file connection.hpp
 * @brief One link to one router: owns every per-link component, no globals.
 *
 * @details
 * WIRING
 * ------
 *   Transport --data--> Dispatcher --resolve--> CorrelationTable <--wait-- CommandEngine
 *                            |                                               ^
 *                            +--errors--> ErrorTracker      RouterCommands --+
 *                                                           ModuleCommands --+
 *                                                           RouterDfu / SensorDfu
 *
 * Every callback the Transport fires runs on this connection's WorkerPool.
 * close() cancels every pending request with ErrorKind::Disconnected before
 * stopping the loops, so blocked callers return immediately.
 *
 * EXAMPLE
 * -------
 * @code
 *   bravejig::Config cfg;
 *   cfg.port = "/dev/ttyACM0";
 *   bravejig::Connection conn(cfg, std::make_unique<bravejig::transport::LinuxSerialPort>(), std::cerr);
 *   std::string err;
 *   if (!conn.open(err)) { ... }
 *   bravejig::RouterVersion v;
 *   auto r = conn.router().get_version(v);
 * @endcode
 */

#include <iosfwd>
#include <memory>
#include <string>

#include "bravejig/command_engine.hpp"
#include "bravejig/config.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/dfu.hpp"
#include "bravejig/dispatcher.hpp"
#include "bravejig/error_tracker.hpp"
#include "bravejig/logger.hpp"
#include "bravejig/module.hpp"
#include "bravejig/router.hpp"
#include "bravejig/transport/transport.hpp"
#include "bravejig/worker_pool.hpp"

namespace bravejig {

class Connection {
public:
    Connection(const Config& cfg, std::unique_ptr<transport::ISerialPort> port, std::ostream& log_out);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Open the port and start the reader/writer loops.
    bool open(std::string& err);

    /// Cancel pending requests, stop the loops, close the port. Idempotent.
    void close();

    bool is_open() const;

    const Config& config() const { return cfg_; }
    Logger& logger() { return log_; }
    transport::Transport& transport() { return transport_; }
    CorrelationTable& correlation() { return table_; }
    ErrorTracker& errors() { return tracker_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    CommandEngine& engine() { return engine_; }
    RouterCommands& router() { return router_; }
    ModuleCommands& modules() { return modules_; }
    RouterDfu& router_dfu() { return router_dfu_; }
    SensorDfu& sensor_dfu() { return sensor_dfu_; }

private:
    Config cfg_;
    Logger log_;
    WorkerPool pool_;
    transport::Transport transport_;
    CorrelationTable table_;
    ErrorTracker tracker_;
    Dispatcher dispatcher_;
    CommandEngine engine_;
    RouterCommands router_;
    ModuleCommands modules_;
    RouterDfu router_dfu_;
    SensorDfu sensor_dfu_;
};

} // namespace bravejig
