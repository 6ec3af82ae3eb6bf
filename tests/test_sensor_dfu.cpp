#include <doctest/doctest.h>
#include <atomic>
#include <cstring>
#include <thread>

#include "bravejig/dfu.hpp"
#include "bravejig/firmware.hpp"
#include "test_support.hpp"

using namespace bravejig;
using namespace bravejig::test;
using namespace std::chrono_literals;

static Bytes pattern(std::size_t n) {
    Bytes b(n);
    for (std::size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(i % 251);
    return b;
}

static FirmwareSource source_of(const Bytes& b) {
    FirmwareSource fw;
    std::string err;
    REQUIRE(FirmwareSource::from_bytes(b, SENSOR_FIRMWARE_MAX + 4, fw, err));
    return fw;
}

// Replies to each sensor DFU block; result for block i comes from `results`.
static FakeSerialPort::Responder dfu_module(std::vector<uint8_t> results, std::atomic<int>& blocks) {
    return [results, &blocks](const Bytes& w) -> std::vector<Bytes> {
        DownlinkRequest rq;
        DecodeError err;
        if (!decode_downlink_request(w, rq, err)) return {};
        const int i = blocks++;
        const uint8_t res = i < static_cast<int>(results.size()) ? results[i] : DOWNLINK_RESULT_SUCCESS;
        return {downlink_reply(rq.device_id, rq.sensor_id, rq.cmd, res, rq.order)};
    };
}

TEST_CASE("CRC32 matches the standard check value") {
    const char* s = "123456789";
    CHECK(crc32(reinterpret_cast<const uint8_t*>(s), std::strlen(s)) == 0xCBF43926u);
}

TEST_CASE("Sensor block count follows the continuation rule") {
    CHECK(sensor_block_count(1) == 3);
    CHECK(sensor_block_count(234) == 3);
    CHECK(sensor_block_count(235) == 3);
    CHECK(sensor_block_count(234 + 238) == 3);
    CHECK(sensor_block_count(234 + 239) == 4);
    CHECK(sensor_block_count(234 + 2 * 238) == 4);
    CHECK(sensor_block_count(234 + 2 * 238 + 1) == 5);

    for (std::size_t n : {300u, 1000u, 4096u, 65536u}) {
        const std::size_t rest = n - 234;
        const std::size_t cont = rest % 238 ? rest / 238 : rest / 238 - 1;
        CHECK(sensor_continuation_count(n) == cont);
    }
}

TEST_CASE("Sensor DFU plan lays out header, second, continuation and final blocks") {
    const Bytes fw = pattern(500);
    SensorDfuPlan plan;
    std::string err;
    REQUIRE(plan_sensor_dfu(fw, plan, err));

    REQUIRE(plan.blocks.size() == 4);
    CHECK(plan.firmware_size == 500);
    CHECK(plan.dfu_data_length == 504);
    CHECK_FALSE(plan.crc_stripped);
    CHECK(plan.crc == crc32(fw));

    const SensorBlock& h = plan.blocks[0];
    CHECK(h.seq == SEQ_HEADER);
    REQUIRE(h.payload.size() == SENSOR_BLOCK_PAYLOAD);
    CHECK(get_u16(&h.payload[0]) == SENSOR_HARDWARE_ID);
    CHECK(h.payload[2] == 0xFF);
    CHECK(h.payload.back() == 0xFF);

    const SensorBlock& s = plan.blocks[1];
    CHECK(s.seq == SEQ_SECOND);
    REQUIRE(s.payload.size() == SENSOR_BLOCK_PAYLOAD);
    CHECK(get_u32(&s.payload[0]) == 504);
    CHECK(Bytes(s.payload.begin() + 4, s.payload.end()) == Bytes(fw.begin(), fw.begin() + 234));

    const SensorBlock& c = plan.blocks[2];
    CHECK(c.seq == SEQ_FIRST_CONTINUATION);
    CHECK(c.phase == "Continue Block 1");
    CHECK(c.payload == Bytes(fw.begin() + 234, fw.begin() + 472));

    const SensorBlock& f = plan.blocks[3];
    CHECK(f.seq == SEQ_FINAL);
    CHECK(f.phase == "Final Block");
    REQUIRE(f.payload.size() == 28 + 4);
    CHECK(Bytes(f.payload.begin(), f.payload.begin() + 28) == Bytes(fw.begin() + 472, fw.end()));
    CHECK(get_u32(&f.payload[28]) == plan.crc);
}

TEST_CASE("Small image pads the second block and leaves only the CRC for the final one") {
    const Bytes fw = pattern(10);
    SensorDfuPlan plan;
    std::string err;
    REQUIRE(plan_sensor_dfu(fw, plan, err));
    REQUIRE(plan.blocks.size() == 3);
    CHECK(plan.blocks[1].payload[4 + 9] == fw[9]);
    CHECK(plan.blocks[1].payload[4 + 10] == 0xFF);
    CHECK(plan.blocks[2].payload.size() == 4);
}

TEST_CASE("A trailing CRC already in the image is stripped before planning") {
    const Bytes fw = pattern(700);
    Bytes image = fw;
    put_u32(image, crc32(fw));
    CHECK(has_embedded_crc(image));
    CHECK_FALSE(has_embedded_crc(fw));

    SensorDfuPlan plan;
    std::string err;
    REQUIRE(plan_sensor_dfu(image, plan, err));
    CHECK(plan.crc_stripped);
    CHECK(plan.firmware_size == 700);
    CHECK(plan.crc == crc32(fw));
    CHECK(plan.blocks.size() == sensor_block_count(700));
}

TEST_CASE("Sensor DFU sends blocks in sequence and reports progress") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> blocks{0};
    rig.port->set_responder(dfu_module({}, blocks));

    const Bytes fw = pattern(1000);
    std::vector<std::string> phases;
    DfuReport rep = rig.conn->sensor_dfu().run(0xA1B2C3D4E5F60708ull, 0x0121, source_of(fw),
        [&](std::size_t, std::size_t total, const std::string& phase) {
            CHECK(total == sensor_block_count(1000));
            phases.push_back(phase);
        });

    REQUIRE(rep.success);
    CHECK(rep.total_blocks == 6);
    CHECK(rep.blocks_completed == 6);
    CHECK(rep.bytes_transferred == 1000);
    CHECK(rep.crc == crc32(fw));
    CHECK(phases.front() == "Header Block");
    CHECK(phases[1] == "Second Block");
    CHECK(phases.back() == "Final Block");

    auto w = rig.port->written();
    REQUIRE(w.size() == 6);
    std::vector<uint16_t> seqs;
    for (const auto& frame : w) {
        DownlinkRequest rq;
        DecodeError err;
        REQUIRE(decode_downlink_request(frame, rq, err));
        CHECK(rq.cmd == MODULE_SENSOR_DFU);
        CHECK(rq.sensor_id == 0x0121);
        seqs.push_back(rq.order);
    }
    CHECK(seqs == std::vector<uint16_t>{0x0000, 0x0001, 0x0002, 0x0003, 0x0004, 0xFFFF});
}

TEST_CASE("Sensor DFU failing at block k reports k-1 completed blocks") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> blocks{0};
    // block 3 of 6 answers "Connection failed"
    rig.port->set_responder(dfu_module({0x00, 0x00, 0x04}, blocks));

    DfuReport rep = rig.conn->sensor_dfu().run(0x99, 0x0001, source_of(pattern(1000)));
    CHECK_FALSE(rep.success);
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Device);
    CHECK(rep.state == DfuState::Failed);
    CHECK(rep.blocks_completed == 2);
    CHECK(rep.total_blocks == 6);
    CHECK(rep.message.find("Continue Block 1") != std::string::npos);
    CHECK(rig.port->written().size() == 3);
}

TEST_CASE("Closing the connection mid-transfer fails the sensor DFU") {
    Rig rig;
    REQUIRE(rig.opened);
    std::atomic<int> blocks{0};
    // header and second block answered, first continuation block never is
    rig.port->set_responder([&blocks](const Bytes& w) -> std::vector<Bytes> {
        DownlinkRequest rq;
        DecodeError err;
        if (!decode_downlink_request(w, rq, err)) return {};
        if (blocks++ >= 2) return {};
        return {downlink_reply(rq.device_id, rq.sensor_id, rq.cmd, DOWNLINK_RESULT_SUCCESS, rq.order)};
    });

    DfuReport rep;
    std::thread runner([&] { rep = rig.conn->sensor_dfu().run(0x99, 0x0001, source_of(pattern(1000))); });
    REQUIRE(rig.port->wait_for_writes(3, 2000ms));
    rig.conn->close();
    runner.join();

    CHECK_FALSE(rep.success);
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Disconnected);
    CHECK(rep.state == DfuState::Failed);
    CHECK(rep.blocks_completed == 2);
    CHECK(rep.message.find("Continue Block 1") != std::string::npos);
    CHECK(rig.conn->sensor_dfu().state() == DfuState::Failed);
}

TEST_CASE("Sensor DFU rejects an empty image") {
    Rig rig;
    REQUIRE(rig.opened);
    DfuReport rep = rig.conn->sensor_dfu().run(0x99, 0x0001, FirmwareSource{});
    CHECK(rep.kind == ErrorKind::Dfu);
    CHECK(rep.cause == ErrorKind::Invalid);
    CHECK(rig.port->written().empty());
}
