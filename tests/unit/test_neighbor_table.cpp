#include <catch2/catch_test_macros.hpp>
#include "network/neighbor_table.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>

using namespace voxlink::network;

TEST_CASE("is_hardware_address accepts colon and dash forms", "[neighbor]") {
    CHECK(is_hardware_address(QStringLiteral("b8:27:eb:12:34:56")));
    CHECK(is_hardware_address(QStringLiteral("B8-27-EB-12-34-56")));
    CHECK_FALSE(is_hardware_address(QStringLiteral("b8:27:eb:12:34")));
    CHECK_FALSE(is_hardware_address(QStringLiteral("b8:27:eb:12:34:5g")));
    CHECK_FALSE(is_hardware_address(QStringLiteral("(incomplete)")));
}

TEST_CASE("parse_hardware_address reads the Windows layout", "[neighbor]") {
    const auto output = QStringLiteral(
        "\nInterface: 192.168.1.10 --- 0x7\n"
        "  Internet Address      Physical Address      Type\n"
        "  192.168.1.1           00-11-22-33-44-55     dynamic\n"
        "  192.168.1.20          b8-27-eb-12-34-56     dynamic\n");

    CHECK(parse_hardware_address(output, QHostAddress(QStringLiteral("192.168.1.20")))
          == QStringLiteral("B8-27-EB-12-34-56"));
}

TEST_CASE("parse_hardware_address reads the Linux layout", "[neighbor]") {
    const auto output = QStringLiteral(
        "? (192.168.1.20) at b8:27:eb:12:34:56 [ether] on wlan0\n");

    CHECK(parse_hardware_address(output, QHostAddress(QStringLiteral("192.168.1.20")))
          == QStringLiteral("B8:27:EB:12:34:56"));
}

TEST_CASE("parse_hardware_address does not match a longer address", "[neighbor]") {
    const auto output = QStringLiteral(
        "? (10.0.0.42) at aa:bb:cc:dd:ee:ff [ether] on eth0\n");

    CHECK(parse_hardware_address(output, QHostAddress(QStringLiteral("10.0.0.4"))).isEmpty());
}

TEST_CASE("parse_hardware_address is empty for incomplete entries", "[neighbor]") {
    const auto output = QStringLiteral(
        "? (192.168.1.30) at <incomplete> on wlan0\n"
        "192.168.1.30 -- no entry\n");

    CHECK(parse_hardware_address(output, QHostAddress(QStringLiteral("192.168.1.30"))).isEmpty());
    CHECK(parse_hardware_address(QString(), QHostAddress(QStringLiteral("192.168.1.30"))).isEmpty());
}

TEST_CASE("NeighborLookup reports empty when the tool is missing", "[neighbor]") {
    NeighborLookup lookup(QStringLiteral("voxlink-no-such-neighbor-tool"), voxlink::Millis(2000));

    int calls = 0;
    QString mac = QStringLiteral("unset");
    lookup.lookup(QHostAddress(QStringLiteral("127.0.0.1")), [&](QString result) {
        ++calls;
        mac = std::move(result);
    });

    QElapsedTimer timer;
    timer.start();
    while (calls == 0 && timer.elapsed() < 5000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }
    // Let any late signal show up as a second call.
    for (int i = 0; i < 5; ++i) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }

    CHECK(calls == 1);
    CHECK(mac.isEmpty());
}
