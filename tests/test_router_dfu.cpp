#include <doctest/doctest.h>
#include <atomic>
#include <thread>

#include "bravejig/dfu.hpp"
#include "bravejig/firmware.hpp"
#include "test_support.hpp"

using namespace bravejig;
using namespace bravejig::test;
using namespace std::chrono_literals;

static FirmwareSource image_of(std::size_t n) {
    Bytes b(n);
    for (std::size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(i * 7);
    FirmwareSource fw;
    std::string err;
    REQUIRE(FirmwareSource::from_bytes(b, ROUTER_FIRMWARE_MAX, fw, err));
    return fw;
}

// Answers write number i (0 = initiation) with results[i], or 0x01 past the end.
static FakeSerialPort::Responder dfu_router(std::vector<int> results, std::atomic<int>& writes) {
    return [results, &writes](const Bytes&) -> std::vector<Bytes> {
        const int i = writes++;
        if (i < static_cast<int>(results.size())) {
            if (results[i] < 0) return {};
            return {dfu_reply(static_cast<uint8_t>(results[i]))};
        }
        return {dfu_reply(DFU_RESULT_READY)};
    };
}

TEST_CASE("Router chunk count is ceil(N/1024)") {
    CHECK(router_chunk_count(0) == 0);
    CHECK(router_chunk_count(1) == 1);
    CHECK(router_chunk_count(1024) == 1);
    CHECK(router_chunk_count(1025) == 2);
    CHECK(router_chunk_count(2049) == 3);
    CHECK(router_chunk_count(100 * 1024) == 100);
}

TEST_CASE("Router DFU initiates, then sends every chunk after its acknowledgment") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    rig.port->set_responder(dfu_router({}, writes));

    std::vector<std::size_t> seen;
    DfuReport rep = rig.conn->router_dfu().run(image_of(2500),
        [&](std::size_t cur, std::size_t total, const std::string& phase) {
            CHECK(total == 3);
            CHECK(phase == "Chunk Transfer");
            seen.push_back(cur);
        });

    REQUIRE(rep.success);
    CHECK(rep.state == DfuState::Completed);
    CHECK(rep.blocks_completed == 3);
    CHECK(rep.total_blocks == 3);
    CHECK(rep.bytes_transferred == 2500);
    CHECK(seen == std::vector<std::size_t>{1, 2, 3});
    CHECK(rig.conn->router_dfu().state() == DfuState::Completed);

    auto w = rig.port->written();
    REQUIRE(w.size() == 4);
    DfuRequest rq;
    DecodeError err;
    REQUIRE(decode_dfu_request(w[0], rq, err));
    CHECK(rq.total_length == 2500);
    CHECK(get_u16(&w[1][0]) == 1024);
    CHECK(w[1].size() == 2 + 1024);
    CHECK(get_u16(&w[3][0]) == 2500 - 2048);
    CHECK(rig.conn->correlation().size() == 0);
}

TEST_CASE("Router DFU rejected at initiation sends no chunk") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    rig.port->set_responder(dfu_router({0x00}, writes));

    DfuReport rep = rig.conn->router_dfu().run(image_of(10));
    CHECK_FALSE(rep.success);
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Device);
    CHECK(rep.blocks_completed == 0);
    CHECK(rep.state == DfuState::Failed);
    CHECK(rig.port->written().size() == 1);
}

TEST_CASE("Router DFU aborts on the first failed chunk") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    // init ok, chunk 1 ok, chunk 2 rejected
    rig.port->set_responder(dfu_router({0x01, 0x01, 0x02}, writes));

    DfuReport rep = rig.conn->router_dfu().run(image_of(3000));
    CHECK_FALSE(rep.success);
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.blocks_completed == 1);
    CHECK(rep.total_blocks == 3);
    CHECK(rep.bytes_transferred == 1024);
    CHECK(rig.port->written().size() == 3);
}

TEST_CASE("Router DFU chunk without acknowledgment times out") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    rig.port->set_responder(dfu_router({0x01, -1}, writes));

    DfuReport rep = rig.conn->router_dfu().run(image_of(100));
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Timeout);
    CHECK(rep.blocks_completed == 0);
}

TEST_CASE("Router error after the last chunk fails the transfer") {
    Config cfg = rig_config();
    cfg.dfu_settle_ms = 1000;
    Rig rig(cfg);
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    rig.port->set_responder([&writes](const Bytes&) -> std::vector<Bytes> {
        if (writes++ == 1) return {dfu_reply(), error_frame(0x01)};
        return {dfu_reply()};
    });

    DfuReport rep = rig.conn->router_dfu().run(image_of(512));
    CHECK_FALSE(rep.success);
    CHECK(rep.cause == ErrorKind::Device);
    REQUIRE(rep.dfu_errors.size() == 1);
    CHECK(rep.dfu_errors[0].reason_text == "invalid request");
    CHECK_FALSE(rig.conn->errors().dfu_tracking_active());
}

TEST_CASE("Closing the connection mid-transfer fails the router DFU") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> writes{0};
    // init ok, chunk 1 ok, chunk 2 never answered
    rig.port->set_responder(dfu_router({0x01, 0x01, -1}, writes));

    DfuReport rep;
    std::thread runner([&] { rep = rig.conn->router_dfu().run(image_of(3000)); });
    REQUIRE(rig.port->wait_for_writes(3, 2000ms));
    rig.conn->close();
    runner.join();

    CHECK_FALSE(rep.success);
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Disconnected);
    CHECK(rep.state == DfuState::Failed);
    CHECK(rep.blocks_completed == 1);
    CHECK(rep.bytes_transferred == 1024);
    CHECK(rig.conn->router_dfu().state() == DfuState::Failed);
    CHECK_FALSE(rig.conn->errors().dfu_tracking_active());
}

TEST_CASE("A second router DFU while one is running is refused as busy") {
    Rig rig;
    REQUIRE(rig.opened);

    // No responder: the first run sits in initiation until its timeout.
    DfuReport first;
    std::thread runner([&] { first = rig.conn->router_dfu().run(image_of(100)); });
    REQUIRE(rig.port->wait_for_writes(1, 2000ms));

    DfuReport second = rig.conn->router_dfu().run(image_of(100));
    CHECK(second.kind == ErrorKind::Dfu);
    CHECK(second.cause == ErrorKind::Busy);
    CHECK(second.state == DfuState::Initiating);

    runner.join();
    CHECK(first.cause == ErrorKind::Timeout);
    CHECK(rig.port->written().size() == 1);
}

TEST_CASE("Router DFU refuses an empty image without touching the wire") {
    Rig rig;
    REQUIRE(rig.opened);
    DfuReport rep = rig.conn->router_dfu().run(FirmwareSource{});
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Invalid);
    CHECK(rig.port->written().empty());
}

TEST_CASE("FirmwareSource validates size and path") {
    FirmwareSource fw;
    std::string err;
    CHECK_FALSE(FirmwareSource::from_bytes(Bytes{}, 10, fw, err));
    CHECK(err == "firmware_empty");
    CHECK_FALSE(FirmwareSource::from_bytes(Bytes(11, 0), 10, fw, err));
    CHECK(err == "firmware_too_large");
    CHECK_FALSE(FirmwareSource::load("/nonexistent/bravejig/fw.bin", 10, fw, err));
    CHECK(err == "firmware_open_failed");
    REQUIRE(FirmwareSource::from_bytes(Bytes(10, 1), 10, fw, err));
    CHECK(fw.size() == 10);
}
