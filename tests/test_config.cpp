#include <doctest/doctest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "bravejig/config.hpp"
#include "bravejig/logger.hpp"
#include "bravejig/packet_json.hpp"
#include "bravejig/codec.hpp"

using namespace bravejig;
using json = nlohmann::json;

static std::string temp_path(const char* tag) {
    return "/tmp/bravejig_test_" + std::string(tag) + "_" + std::to_string(::getpid()) + ".json";
}

TEST_CASE("Defaults match the router's expectations") {
    Config c;
    CHECK(c.baud == DFU_REQUIRED_BAUD);
    CHECK(c.command_timeout_ms == 10000);
    CHECK(c.worker_threads == 4);
    CHECK(c.log_level == LogLevel::Info);
    CHECK(c.port.empty());
}

TEST_CASE("JSON overrides only the keys it names") {
    Config c;
    std::string err;
    REQUIRE(apply_config_json(json{{"port", "/dev/ttyACM1"}, {"baud", 115200}, {"log_level", "debug"}}, c, err));
    CHECK(c.port == "/dev/ttyACM1");
    CHECK(c.baud == 115200);
    CHECK(c.log_level == LogLevel::Debug);
    CHECK(c.command_timeout_ms == 10000);
}

TEST_CASE("Bad values are rejected and leave the config untouched") {
    Config c;
    std::string err;
    CHECK_FALSE(apply_config_json(json{{"port", "/dev/x"}, {"command_timeout_ms", -5}}, c, err));
    CHECK(err == "config_bad_value:command_timeout_ms");
    CHECK(c.port.empty());

    CHECK_FALSE(apply_config_json(json{{"log_level", "loud"}}, c, err));
    CHECK(err == "config_bad_value:log_level");
    CHECK_FALSE(apply_config_json(json{{"worker_threads", 1000}}, c, err));
    CHECK_FALSE(apply_config_json(json::array(), c, err));
    CHECK(err == "config_parse_error");
}

TEST_CASE("Config file: missing is fine, malformed is an error") {
    Config c;
    std::string err;
    CHECK(load_config_file("/nonexistent/bravejig/config.json", c, err));

    const std::string bad = temp_path("bad");
    {
        std::ofstream out(bad);
        out << "{ \"port\": ";
    }
    CHECK_FALSE(load_config_file(bad, c, err));
    CHECK(err == "config_parse_error");
    std::remove(bad.c_str());

    const std::string good = temp_path("good");
    {
        std::ofstream out(good);
        out << config_to_json(Config{}).dump();
    }
    Config d;
    d.port = "/dev/before";
    REQUIRE(load_config_file(good, d, err));
    CHECK(d.port.empty());
    std::remove(good.c_str());
}

TEST_CASE("default_config_path follows XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    CHECK(default_config_path() == "/tmp/xdg/bravejig/config.json");
    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("Logger writes key=value records at or above its level") {
    std::ostringstream out;
    Logger log(out, LogLevel::Warn);
    log.info("transport", "hidden");
    log.warn("transport", "send_rejected", "reason=not_monitoring");
    log.error("dispatch", "two words");

    const std::string s = out.str();
    CHECK(s.find("hidden") == std::string::npos);
    CHECK(s.find("level=warn comp=transport msg=send_rejected reason=not_monitoring") != std::string::npos);
    CHECK(s.find("msg=\"two words\"") != std::string::npos);

    LogLevel l;
    CHECK(parse_log_level("error", l));
    CHECK(l == LogLevel::Error);
    CHECK_FALSE(parse_log_level("verbose", l));
}

TEST_CASE("Frames and results render to JSON") {
    UplinkNotification u;
    u.device_id = 0x1122;
    u.sensor_id = 0x0121;
    u.rssi = -70;
    u.payload = {0xDE, 0xAD};
    json j = to_json(Frame(u));
    CHECK(j["kind"] == "uplink");
    CHECK(j["sensor_id"] == "0x0121");
    CHECK(j["rssi"] == -70);

    CommandResult r = CommandResult::fail(ErrorKind::Timeout, "no response");
    json jr = to_json(r);
    CHECK(jr["status"] == "error");
    CHECK(jr["error_kind"] == "timeout");
}
