#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "network/device.hpp"

using namespace voxlink;
using namespace voxlink::network;
using Catch::Matchers::WithinAbs;

TEST_CASE("decode_capabilities reads snake_case payloads", "[device][capabilities]") {
    auto caps = decode_capabilities(R"({
        "name": "Kitchen Pi",
        "version": "1.4.0",
        "model": "Raspberry Pi 4",
        "serial_number": "0000abcd",
        "status": {
            "cpu_usage": 12.5, "memory_usage": 40.0, "temperature": 51.2,
            "disk_usage": 33.0, "uptime": 3600, "is_recording": true,
            "active_connections": 2
        },
        "audio": {
            "supported_formats": ["wav", "pcm"], "supported_sample_rates": [16000, 44100],
            "max_channels": 2, "audio_device": "hw:1,0", "has_microphone": true
        }
    })");

    REQUIRE(caps.is_ok());
    const auto& c = caps.unwrap();
    CHECK(c.name == QStringLiteral("Kitchen Pi"));
    CHECK(c.serial == QStringLiteral("0000abcd"));
    CHECK_THAT(c.status.uptime_seconds, WithinAbs(3600.0, 1e-9));
    CHECK(c.status.is_recording);
    CHECK(c.status.active_connections == 2);
    CHECK(c.audio.supported_formats == QStringList{QStringLiteral("wav"), QStringLiteral("pcm")});
    CHECK(c.audio.supported_sample_rates == std::vector<int>{16000, 44100});
    CHECK(c.audio.has_microphone);
}

TEST_CASE("decode_capabilities accepts PascalCase and span uptime", "[device][capabilities]") {
    auto caps = decode_capabilities(R"({
        "Name": "Pi", "Version": "2.0", "Model": "Zero 2",
        "Status": {"CpuUsage": 3.0, "Uptime": "1.02:03:04"},
        "Audio": {"MaxChannels": 1, "HasMicrophone": false}
    })");

    REQUIRE(caps.is_ok());
    const auto& c = caps.unwrap();
    CHECK(c.name == QStringLiteral("Pi"));
    CHECK(c.model == QStringLiteral("Zero 2"));
    CHECK_THAT(c.status.uptime_seconds, WithinAbs(93784.0, 1e-9));
    CHECK(c.audio.max_channels == 1);
}

TEST_CASE("decode_capabilities rejects malformed payloads", "[device][capabilities]") {
    CHECK(decode_capabilities("").is_err());
    CHECK(decode_capabilities("<html>500</html>").is_err());
    CHECK(decode_capabilities("[]").is_err());
    CHECK(decode_capabilities(R"({"name": 5})").is_err());
    CHECK(decode_capabilities(R"({"status": {"uptime": "forever"}})").is_err());
    CHECK(decode_capabilities(R"({"audio": {"supported_sample_rates": ["fast"]}})").is_err());

    auto err = decode_capabilities(R"({"status": []})");
    REQUIRE(err.is_err());
    CHECK(err.unwrap_err().kind == ErrorKind::Decode);
}

TEST_CASE("Device display_name falls back to hostname then address", "[device]") {
    Device device;
    device.address = QHostAddress(QStringLiteral("10.0.0.42"));
    device.port = 8000;
    CHECK(device.display_name() == QStringLiteral("device@10.0.0.42"));

    device.hostname = QStringLiteral("raspberrypi.local");
    CHECK(device.display_name() == QStringLiteral("raspberrypi.local"));

    device.capabilities = DeviceCapabilities{};
    device.capabilities->name = QStringLiteral("Living Room");
    CHECK(device.display_name() == QStringLiteral("Living Room"));
}

TEST_CASE("Device identity is address and port", "[device]") {
    Device a;
    a.address = QHostAddress(QStringLiteral("10.0.0.42"));
    a.port = 8000;
    Device b = a;
    b.hostname = QStringLiteral("pi.local");
    b.hardware_address = QStringLiteral("AA:BB:CC:DD:EE:FF");

    CHECK(a == b);
    CHECK(a.key() == QStringLiteral("10.0.0.42:8000"));
    b.port = 8001;
    CHECK_FALSE(a == b);
}
