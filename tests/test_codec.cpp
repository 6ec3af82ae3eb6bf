#include <doctest/doctest.h>
#include "bravejig/byte_order.hpp"
#include "bravejig/codec.hpp"

using namespace bravejig;

static Bytes hex_bytes(std::initializer_list<int> v) {
    Bytes b;
    for (int x : v) b.push_back(static_cast<uint8_t>(x));
    return b;
}

TEST_CASE("JIG-Info request carries cmd, JST local time and unix time") {
    Bytes b = encode_jig_info_request(JIG_GET_VERSION, 1000);
    REQUIRE(b.size() == JIG_INFO_REQUEST_SIZE);
    CHECK(b[0] == 0x01);
    CHECK(b[1] == TYPE_JIG_INFO_REQUEST);
    CHECK(b[2] == JIG_GET_VERSION);
    CHECK(get_u32(&b[3]) == 1000 + 9 * 3600);
    CHECK(get_u32(&b[7]) == 1000);
}

TEST_CASE("Downlink request layout is little-endian with data_len counting data only") {
    Bytes data = hex_bytes({0xAA, 0xBB, 0xCC});
    Bytes b = encode_downlink_request(0x1122334455667788ull, 0x0121, MODULE_SET_PARAMETER, 0x0203,
                                      data, 0x01020304);
    REQUIRE(b.size() == DOWNLINK_REQUEST_HEADER + 3);
    CHECK(b[1] == TYPE_DOWNLINK_REQUEST);
    CHECK(get_u16(&b[2]) == 3);
    CHECK(get_u32(&b[4]) == 0x01020304u);
    CHECK(b[8] == 0x88);
    CHECK(b[15] == 0x11);
    CHECK(b[16] == 0x21);
    CHECK(b[17] == 0x01);
    CHECK(b[18] == MODULE_SET_PARAMETER);
    CHECK(get_u16(&b[19]) == 0x0203);
    CHECK(b[21] == 0xAA);
}

TEST_CASE("Uplink with sensor 0x0121 and no payload") {
    Bytes b = hex_bytes({0x01, 0x00, 0x00, 0x00,
                         0x10, 0x20, 0x30, 0x40,
                         0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11,
                         0x21, 0x01, 0x00, 0x00, 0x00});
    UplinkNotification u;
    DecodeError err;
    REQUIRE(decode_uplink_notification(b, u, err));
    CHECK(u.sensor_id == 0x0121);
    CHECK(u.device_id == 0x1122334455667788ull);
    CHECK(u.unix_time == 0x40302010u);
    CHECK(u.payload.empty());
    CHECK_FALSE(u.is_parameter_info());
}

TEST_CASE("Uplink rssi is signed and payload is everything past the header") {
    Bytes b(UPLINK_HEADER, 0);
    b[0] = 0x01;
    b[18] = 0xC4; // -60
    b.push_back(0x7E);
    b.push_back(0x7F);
    UplinkNotification u;
    DecodeError err;
    REQUIRE(decode_uplink_notification(b, u, err));
    CHECK(u.rssi == -60);
    CHECK(u.payload == hex_bytes({0x7E, 0x7F}));
    CHECK(u.is_parameter_info());
}

TEST_CASE("Packets survive encode/decode at field boundaries") {
    DecodeError err;

    SUBCASE("JigInfoRequest") {
        JigInfoRequest in{0xFF, 0xFFFFFFFFu, 0};
        JigInfoRequest out;
        REQUIRE(decode_jig_info_request(encode(in), out, err));
        CHECK(out == in);
    }
    SUBCASE("JigInfoResponse") {
        JigInfoResponse in;
        in.unix_time = 0xFFFFFFFFu;
        in.cmd = JIG_GET_DEVICE_ID_ALL;
        in.router_id = 0xFFFFFFFFFFFFFFFFull;
        in.payload = hex_bytes({1, 2, 3});
        JigInfoResponse out;
        REQUIRE(decode_jig_info_response(encode(in), out, err));
        CHECK(out == in);
    }
    SUBCASE("DownlinkRequest") {
        DownlinkRequest in{0, 0xFFFFFFFFFFFFFFFFull, 0xFFFF, MODULE_DEVICE_RESTART, 0xFFFF, {}};
        DownlinkRequest out;
        REQUIRE(decode_downlink_request(encode(in), out, err));
        CHECK(out == in);
    }
    SUBCASE("DownlinkResponse, both forms") {
        DownlinkResponse full;
        full.device_id = 0;
        full.sensor_id = 0xFFFF;
        full.order = 0xFFFF;
        full.cmd = MODULE_SENSOR_DFU;
        full.result = 0xFF;
        DownlinkResponse out;
        REQUIRE(decode_downlink_response(encode(full), out, err));
        CHECK(out == full);

        DownlinkResponse compact;
        compact.form = DownlinkForm::Compact;
        compact.data_length = 0xFFFF;
        compact.device_id = 0xFFFFFFFFFFFFFFFFull;
        compact.sensor_id = 0;
        compact.result = 0x03;
        REQUIRE(decode_downlink_response(encode(compact), out, err));
        CHECK(out == compact);
    }
    SUBCASE("UplinkNotification") {
        UplinkNotification in;
        in.data_length = 2;
        in.device_id = 0xFFFFFFFFFFFFFFFFull;
        in.sensor_id = 0;
        in.rssi = -128;
        in.order = 0xFFFF;
        in.payload = hex_bytes({0x00, 0xFF});
        UplinkNotification out;
        REQUIRE(decode_uplink_notification(encode(in), out, err));
        CHECK(out == in);
    }
    SUBCASE("DFU request and response") {
        DfuRequest rq{0xFFFFFFFFu, 0};
        DfuRequest rq_out;
        REQUIRE(decode_dfu_request(encode(rq), rq_out, err));
        CHECK(rq_out == rq);

        DfuResponse rs{0, DFU_RESULT_READY};
        DfuResponse rs_out;
        REQUIRE(decode_dfu_response(encode(rs), rs_out, err));
        CHECK(rs_out == rs);
    }
    SUBCASE("ErrorNotification, both type bytes") {
        for (uint8_t t : {TYPE_ERROR, TYPE_ERROR_LEGACY}) {
            ErrorNotification in{t, 0xFFFFFFFFu, 0x06};
            ErrorNotification out;
            REQUIRE(decode_error_notification(encode(in), out, err));
            CHECK(out == in);
        }
    }
}

TEST_CASE("Downlink response accepts exactly 19 or 20 bytes") {
    DownlinkResponse out;
    DecodeError err;

    Bytes b = encode(DownlinkResponse{});
    REQUIRE(b.size() == DOWNLINK_RESPONSE_FULL);
    b.push_back(0);
    CHECK_FALSE(decode_downlink_response(b, out, err));
    CHECK(err == DecodeError::BadLength);

    Bytes s(18, 0);
    s[0] = 0x01;
    CHECK_FALSE(decode_downlink_response(s, out, err));
    CHECK(err == DecodeError::ShortPacket);
}

TEST_CASE("Error notification must be exactly 7 bytes") {
    ErrorNotification out;
    DecodeError err;

    Bytes b = encode(ErrorNotification{TYPE_ERROR, 1, 0x01});
    REQUIRE(b.size() == ERROR_NOTIFICATION_SIZE);
    CHECK(decode_error_notification(b, out, err));

    Bytes longer = b;
    longer.push_back(0);
    CHECK_FALSE(decode_error_notification(longer, out, err));
    CHECK(err == DecodeError::BadLength);

    Bytes shorter(b.begin(), b.end() - 1);
    CHECK_FALSE(decode_error_notification(shorter, out, err));
    CHECK(err == DecodeError::ShortPacket);
}

TEST_CASE("Decoders reject a foreign protocol version") {
    Bytes b = encode(DfuResponse{0, 1});
    b[0] = 0x02;
    DfuResponse out;
    DecodeError err;
    CHECK_FALSE(decode_dfu_response(b, out, err));
    CHECK(err == DecodeError::BadVersion);

    Frame f;
    CHECK_FALSE(classify_and_decode(b, f, err));
    CHECK(err == DecodeError::BadVersion);
}

TEST_CASE("classify_and_decode picks the kind by type byte and length") {
    Frame f;
    DecodeError err;

    SUBCASE("type 0x02, 15 bytes is a JIG-Info response") {
        JigInfoResponse j;
        j.cmd = JIG_ROUTER_START;
        REQUIRE(classify_and_decode(encode(j), f, err));
        CHECK(std::holds_alternative<JigInfoResponse>(f));
    }
    SUBCASE("type 0x02 with a payload is a JIG-Info response") {
        JigInfoResponse j;
        j.cmd = JIG_GET_VERSION;
        j.payload = hex_bytes({1, 2, 3});
        REQUIRE(classify_and_decode(encode(j), f, err));
        REQUIRE(std::holds_alternative<JigInfoResponse>(f));
        CHECK(std::get<JigInfoResponse>(f).payload.size() == 3);
    }
    SUBCASE("type 0x01, 20 bytes is a full Downlink response") {
        DownlinkResponse d;
        d.device_id = 42;
        d.cmd = MODULE_SET_PARAMETER;
        REQUIRE(classify_and_decode(encode(d), f, err));
        REQUIRE(std::holds_alternative<DownlinkResponse>(f));
        CHECK(std::get<DownlinkResponse>(f).form == DownlinkForm::Full);
        CHECK(std::get<DownlinkResponse>(f).device_id == 42);
    }
    SUBCASE("type 0x01, 19 bytes is a compact Downlink response") {
        DownlinkResponse d;
        d.form = DownlinkForm::Compact;
        d.sensor_id = 0x0121;
        REQUIRE(classify_and_decode(encode(d), f, err));
        REQUIRE(std::holds_alternative<DownlinkResponse>(f));
        CHECK(std::get<DownlinkResponse>(f).form == DownlinkForm::Compact);
    }
    SUBCASE("type 0x02, 19 bytes is taken as a compact Downlink response") {
        DownlinkResponse d;
        d.type = TYPE_JIG_INFO_RESPONSE;
        d.form = DownlinkForm::Compact;
        REQUIRE(classify_and_decode(encode(d), f, err));
        CHECK(std::holds_alternative<DownlinkResponse>(f));
    }
    SUBCASE("type 0x02, 20 bytes stays a JIG-Info response") {
        JigInfoResponse r;
        r.cmd = JIG_GET_VERSION;
        r.payload = Bytes{1, 2, 3, 4, 5};
        const Bytes raw = encode(r);
        REQUIRE(raw.size() == 20);
        REQUIRE(classify_and_decode(raw, f, err));
        REQUIRE(std::holds_alternative<JigInfoResponse>(f));
        CHECK(std::get<JigInfoResponse>(f).cmd == JIG_GET_VERSION);
        CHECK(std::get<JigInfoResponse>(f).payload == Bytes{1, 2, 3, 4, 5});
    }
    SUBCASE("type 0x03 is a DFU response") {
        REQUIRE(classify_and_decode(encode(DfuResponse{5, DFU_RESULT_READY}), f, err));
        REQUIRE(std::holds_alternative<DfuResponse>(f));
        CHECK(std::get<DfuResponse>(f).result == DFU_RESULT_READY);
    }
    SUBCASE("type 0x00 is an uplink") {
        UplinkNotification u;
        u.device_id = 7;
        REQUIRE(classify_and_decode(encode(u), f, err));
        CHECK(std::holds_alternative<UplinkNotification>(f));
    }
    SUBCASE("types 0x04 and 0xFF are error notifications") {
        REQUIRE(classify_and_decode(encode(ErrorNotification{TYPE_ERROR_LEGACY, 0, 1}), f, err));
        CHECK(std::holds_alternative<ErrorNotification>(f));
        REQUIRE(classify_and_decode(encode(ErrorNotification{TYPE_ERROR, 0, 2}), f, err));
        CHECK(std::get<ErrorNotification>(f).reason == 2);
    }
    SUBCASE("unknown type byte") {
        CHECK_FALSE(classify_and_decode(hex_bytes({0x01, 0x05, 0, 0, 0, 0, 0}), f, err));
        CHECK(err == DecodeError::UnknownType);
    }
    SUBCASE("too short for any kind") {
        CHECK_FALSE(classify_and_decode(hex_bytes({0x01}), f, err));
        CHECK(err == DecodeError::ShortPacket);
        CHECK_FALSE(classify_and_decode(hex_bytes({0x01, 0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}), f, err));
        CHECK(err == DecodeError::ShortPacket);
    }
}

TEST_CASE("Router DFU chunks are [len u16][bytes] of at most 1024 bytes") {
    Bytes fw(2049);
    for (std::size_t i = 0; i < fw.size(); ++i) fw[i] = static_cast<uint8_t>(i);

    auto chunks = split_firmware_into_chunks(fw, ROUTER_DFU_CHUNK_MAX);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size() == 2 + 1024);
    CHECK(get_u16(&chunks[0][0]) == 1024);
    CHECK(chunks[1][2] == static_cast<uint8_t>(1024));
    CHECK(chunks[2].size() == 3);
    CHECK(get_u16(&chunks[2][0]) == 1);
    CHECK(chunks[2][2] == static_cast<uint8_t>(2048));

    CHECK(split_firmware_into_chunks(Bytes{}, ROUTER_DFU_CHUNK_MAX).empty());
}

TEST_CASE("Reason and result tables") {
    CHECK(interpret_error_reason(0x01) == "invalid request");
    CHECK(interpret_error_reason(0x06) == "device id not registered at index");
    CHECK(interpret_error_reason(0x99) == "unknown error reason: 0x99");
    CHECK(std::string(error_type_name(TYPE_ERROR_LEGACY)) == "Legacy Error");
    CHECK(std::string(downlink_result_text(0x00)) == "Success");
    CHECK(to_hex(hex_bytes({0x01, 0xAB})) == "01 AB");
}
