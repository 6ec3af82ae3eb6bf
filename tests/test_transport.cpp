#include <doctest/doctest.h>
#include <atomic>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "bravejig/logger.hpp"
#include "bravejig/router.hpp"
#include "bravejig/transport/transport.hpp"
#include "bravejig/worker_pool.hpp"
#include "test_support.hpp"

using namespace bravejig;
using namespace bravejig::test;
using namespace bravejig::transport;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    std::ostringstream sink;
    Logger log{sink, LogLevel::Off};
    WorkerPool pool{2, log};
    FakeSerialPort* port{nullptr};
    std::unique_ptr<Transport> tx;

    Fixture() {
        auto p = std::make_unique<FakeSerialPort>();
        port = p.get();
        tx = std::make_unique<Transport>(std::move(p), pool, log);
        pool.start();
    }
    ~Fixture() {
        tx.reset();
        pool.shutdown();
    }

    bool up() {
        PortConfig pc;
        pc.path = "/dev/fake0";
        std::string err;
        return tx->connect(pc, err) && tx->start_monitoring();
    }
};

template <typename Pred>
bool eventually(Pred p, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (p()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return p();
}

} // namespace

TEST_CASE("Transport walks Disconnected -> Connected -> Monitoring and back") {
    Fixture fx;
    CHECK(fx.tx->state() == TransportState::Disconnected);

    std::vector<bool> links;
    std::mutex m;
    fx.tx->set_connection_callback([&](bool up) {
        std::lock_guard<std::mutex> lk(m);
        links.push_back(up);
    });

    PortConfig pc;
    pc.path = "/dev/fake0";
    pc.baud = 115200;
    std::string err;
    REQUIRE(fx.tx->connect(pc, err));
    CHECK(fx.tx->state() == TransportState::Connected);
    CHECK(fx.port->config().baud == 115200);
    CHECK_FALSE(fx.tx->connect(pc, err));
    CHECK(err == "already_connected");

    REQUIRE(fx.tx->start_monitoring());
    CHECK(fx.tx->is_monitoring());

    fx.tx->stop_monitoring();
    CHECK(fx.tx->state() == TransportState::Connected);

    fx.tx->disconnect();
    CHECK(fx.tx->state() == TransportState::Disconnected);
    CHECK_FALSE(fx.port->is_open());

    CHECK(eventually([&] {
        std::lock_guard<std::mutex> lk(m);
        return links.size() == 2;
    }));
    CHECK(fx.tx->statistics().connection_attempts == 1);
}

TEST_CASE("connect reports the port's open error") {
    Fixture fx;
    fx.port->fail_open(true);
    PortConfig pc;
    pc.path = "/dev/missing";
    std::string err;
    CHECK_FALSE(fx.tx->connect(pc, err));
    CHECK(err == "open_failed");
    CHECK(fx.tx->state() == TransportState::Disconnected);
    CHECK_FALSE(fx.tx->start_monitoring());
}

TEST_CASE("send is refused unless monitoring") {
    Fixture fx;
    CHECK_FALSE(fx.tx->send(Bytes{0x01}));
    PortConfig pc;
    pc.path = "/dev/fake0";
    std::string err;
    REQUIRE(fx.tx->connect(pc, err));
    CHECK_FALSE(fx.tx->send(Bytes{0x01}));
}

TEST_CASE("Each send is one write, in order") {
    Fixture fx;
    REQUIRE(fx.up());
    for (uint8_t i = 0; i < 10; ++i) REQUIRE(fx.tx->send(Bytes{0x01, i, i}));
    REQUIRE(fx.port->wait_for_writes(10, 2000ms));

    auto w = fx.port->written();
    REQUIRE(w.size() == 10);
    for (uint8_t i = 0; i < 10; ++i) CHECK(w[i] == Bytes{0x01, i, i});
    CHECK(eventually([&] { return fx.tx->statistics().frames_sent == 10; }));
    CHECK(fx.tx->statistics().bytes_sent == 30);
}

TEST_CASE("A failed write is reported and the writer keeps going") {
    Fixture fx;
    std::atomic<int> write_errors{0};
    fx.tx->set_error_callback([&](TransportError e, const std::string&) {
        if (e == TransportError::Write) ++write_errors;
    });
    REQUIRE(fx.up());

    fx.port->fail_next_writes(1);
    REQUIRE(fx.tx->send(Bytes{0xAA}));
    REQUIRE(fx.tx->send(Bytes{0xBB}));
    REQUIRE(fx.port->wait_for_writes(1, 2000ms));

    CHECK(fx.port->written().front() == Bytes{0xBB});
    CHECK(eventually([&] { return write_errors == 1; }));
    CHECK(fx.tx->statistics().write_errors == 1);
    CHECK(fx.tx->is_monitoring());
}

TEST_CASE("Inbound frames reach the data callback through the pool") {
    Fixture fx;
    std::mutex m;
    std::vector<Bytes> got;
    fx.tx->set_data_callback([&](const Bytes& f) {
        std::lock_guard<std::mutex> lk(m);
        got.push_back(f);
    });
    REQUIRE(fx.up());

    fx.port->inject(Bytes{0x01, 0x02, 0x03});
    fx.port->inject(Bytes{0x01, 0xFF});
    CHECK(eventually([&] {
        std::lock_guard<std::mutex> lk(m);
        return got.size() == 2;
    }));
    CHECK(fx.tx->statistics().bytes_received == 5);
    CHECK(fx.tx->statistics().frames_received == 2);
}

TEST_CASE("A read error stops the reader and is reported once") {
    Fixture fx;
    std::atomic<int> read_errors{0};
    fx.tx->set_error_callback([&](TransportError e, const std::string&) {
        if (e == TransportError::Read) ++read_errors;
    });
    REQUIRE(fx.up());
    fx.port->break_reads();
    CHECK(eventually([&] { return read_errors == 1; }));
    std::this_thread::sleep_for(30ms);
    CHECK(read_errors == 1);
}

TEST_CASE("A lost link refuses sends until monitoring restarts") {
    Fixture fx;
    std::atomic<int> downs{0};
    fx.tx->set_connection_callback([&](bool up) { if (!up) ++downs; });
    REQUIRE(fx.up());

    fx.port->break_reads();
    CHECK(eventually([&] { return fx.tx->link_lost(); }));
    CHECK_FALSE(fx.tx->is_monitoring());
    CHECK_FALSE(fx.tx->send(Bytes{0x01}));
    CHECK(eventually([&] { return downs == 1; }));
    CHECK(fx.port->written().empty());

    fx.tx->disconnect();
    CHECK(fx.tx->state() == TransportState::Disconnected);
}

TEST_CASE("Connection closes itself when the port stops reading") {
    Rig rig;
    REQUIRE(rig.opened);
    REQUIRE(rig.conn->is_open());

    rig.port->break_reads();
    CHECK(eventually([&] { return !rig.conn->is_open(); }));

    auto t0 = std::chrono::steady_clock::now();
    CommandResult r = rig.conn->router().keep_alive();
    CHECK(r.kind == ErrorKind::Connection);
    CHECK(std::chrono::steady_clock::now() - t0 < 400ms);
    CHECK(rig.port->written().empty());
}

TEST_CASE("A full send queue rejects the frame and reports QueueFull") {
    Fixture fx;
    std::atomic<int> queue_full{0};
    fx.tx->set_error_callback([&](TransportError e, const std::string&) {
        if (e == TransportError::QueueFull) ++queue_full;
    });
    REQUIRE(fx.up());

    fx.port->hold_writes(true);
    std::size_t accepted = 0;
    while (accepted < 2 * Transport::SEND_QUEUE_CAP && fx.tx->send(Bytes{0x01, 0x00}))
        ++accepted;

    // The writer may have taken one frame off the queue before stalling.
    CHECK(accepted >= Transport::SEND_QUEUE_CAP);
    CHECK(accepted <= Transport::SEND_QUEUE_CAP + 1);
    CHECK_FALSE(fx.tx->send(Bytes{0x01, 0x01}));
    CHECK(eventually([&] { return queue_full == 2; }));
    CHECK(fx.tx->is_monitoring());

    fx.port->hold_writes(false);
    REQUIRE(fx.port->wait_for_writes(accepted, 2000ms));
    CHECK(fx.port->written().size() == accepted);
    CHECK(fx.tx->send(Bytes{0x01, 0x02}));
}

TEST_CASE("WorkerPool runs tasks and survives a throwing one") {
    std::ostringstream sink;
    Logger log(sink, LogLevel::Error);
    WorkerPool pool(2, log);

    CHECK_FALSE(pool.submit([] {}));
    pool.start();

    std::atomic<int> n{0};
    REQUIRE(pool.submit([] { throw std::runtime_error("boom"); }));
    for (int i = 0; i < 20; ++i) REQUIRE(pool.submit([&] { ++n; }));
    CHECK(pool.wait_idle(2000ms));
    CHECK(n == 20);
    CHECK(pool.executed() == 21);
    CHECK(sink.str().find("boom") != std::string::npos);

    pool.shutdown();
    CHECK_FALSE(pool.submit([] {}));
}

TEST_CASE("WorkerPool refuses tasks past its queue capacity") {
    std::ostringstream sink;
    Logger log(sink, LogLevel::Error);
    WorkerPool pool(1, log);
    pool.start();

    std::atomic<bool> release{false};
    std::atomic<bool> blocking{false};
    REQUIRE(pool.submit([&] {
        blocking = true;
        while (!release) std::this_thread::sleep_for(1ms);
    }));
    REQUIRE(eventually([&] { return blocking.load(); }));

    std::atomic<int> n{0};
    for (std::size_t i = 0; i < WorkerPool::TASK_QUEUE_CAP; ++i) REQUIRE(pool.submit([&] { ++n; }));
    CHECK_FALSE(pool.submit([&] { ++n; }));
    CHECK(pool.dropped() == 1);
    CHECK(sink.str().find("task_dropped") != std::string::npos);

    release = true;
    CHECK(pool.wait_idle(2000ms));
    CHECK(n == static_cast<int>(WorkerPool::TASK_QUEUE_CAP));
    CHECK(pool.submit([] {}));
    pool.shutdown();
}
