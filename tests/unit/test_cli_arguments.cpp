#include <catch2/catch_test_macros.hpp>
#include "cli/arguments.hpp"

using namespace voxlink;
using namespace voxlink::cli;

TEST_CASE("Subnet options parse every CIDR", "[cli]") {
    auto subnets = parse_subnet_options({QStringLiteral("10.0.0.0/24"), QStringLiteral("192.168.1.7/24")});

    REQUIRE(subnets.is_ok());
    REQUIRE(subnets.unwrap().size() == 2);
    CHECK(subnets.unwrap()[1].to_cidr() == QStringLiteral("192.168.1.0/24"));
    CHECK(parse_subnet_options({}).unwrap().empty());
}

TEST_CASE("An invalid subnet option is a usage error", "[cli]") {
    auto subnets = parse_subnet_options({QStringLiteral("10.0.0.0/24"), QStringLiteral("10.0.0/33")});

    REQUIRE(subnets.is_err());
    CHECK(subnets.unwrap_err().kind == ErrorKind::InvalidArgument);
    CHECK(subnets.unwrap_err().message == "Invalid subnet: 10.0.0/33");
    CHECK(kExitUsage == 2);
}

TEST_CASE("Port options are limited to 1..65535", "[cli]") {
    CHECK(parse_port_option(QStringLiteral("8000")).unwrap() == 8000);
    CHECK(parse_port_option(QStringLiteral("65535")).unwrap() == 65535);
    CHECK(parse_port_option(QStringLiteral("0")).is_err());
    CHECK(parse_port_option(QStringLiteral("65536")).is_err());
    CHECK(parse_port_option(QStringLiteral("-1")).is_err());
    CHECK(parse_port_option(QStringLiteral("http")).unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Duration options are bounded", "[cli]") {
    CHECK(parse_duration_option(QStringLiteral("0")).unwrap() == std::chrono::seconds(0));
    CHECK(parse_duration_option(QStringLiteral(" 90 ")).unwrap() == std::chrono::seconds(90));
    CHECK(parse_duration_option(QString::number(kMaxListenDuration.count())).unwrap() == kMaxListenDuration);

    // Would overflow an int of milliseconds.
    auto huge = parse_duration_option(QStringLiteral("3000000"));
    REQUIRE(huge.is_err());
    CHECK(huge.unwrap_err().kind == ErrorKind::InvalidArgument);

    CHECK(parse_duration_option(QStringLiteral("99999999999999999999")).is_err());
    CHECK(parse_duration_option(QStringLiteral("-5")).is_err());
    CHECK(parse_duration_option(QStringLiteral("soon")).is_err());
}
