#include <catch2/catch_test_macros.hpp>
#include "network/discovery_engine.hpp"
#include "../test_support.hpp"

#include <QHash>
#include <QSet>
#include <QTimer>
#include <algorithm>
#include <stdexcept>

using namespace voxlink;
using namespace voxlink::network;
using voxlink::testing::waitUntil;

namespace {

Device device_at(const QHostAddress& address, const QString& hostname = QString()) {
    Device device;
    device.address = address;
    device.hostname = hostname;
    device.port = 8000;
    device.last_seen = Timestamp::now();
    return device;
}

/**
 * Scripted HostProbe. Answers for the addresses in `live`, resolves the
 * names in `names`, and records how many probes overlap.
 */
class StubProbe final : public HostProbe {
public:
    struct Stats {
        int started = 0;
        int in_flight = 0;
        int max_in_flight = 0;
        int hostname_probes = 0;
    };

    explicit StubProbe(std::shared_ptr<Stats> stats) : stats_(std::move(stats)) {}

    // Negative: answer synchronously, from inside probe_address().
    int delay_ms = 1;
    QSet<QString> live;
    QHash<QString, QString> names;
    // Attach capabilities once the handshake was reported.
    bool enrich = false;

    void probe_address(const QHostAddress& address, ProbeCallbacks callbacks) override {
        ++stats_->started;
        ++stats_->in_flight;
        stats_->max_in_flight = std::max(stats_->max_in_flight, stats_->in_flight);
        run([this, address, callbacks]() {
            --stats_->in_flight;
            answer(address, QString(), callbacks);
        });
    }

    void probe_hostname(const QString& hostname, ProbeCallbacks callbacks) override {
        ++stats_->hostname_probes;
        run([this, hostname, callbacks]() {
            if (!names.contains(hostname)) {
                callbacks.finished(std::nullopt);
                return;
            }
            answer(QHostAddress(names.value(hostname)), hostname, callbacks);
        });
    }

private:
    std::shared_ptr<Stats> stats_;
    QObject context_;

    void run(std::function<void()> step) {
        if (delay_ms < 0) {
            step();
        } else {
            QTimer::singleShot(delay_ms, &context_, std::move(step));
        }
    }

    void answer(const QHostAddress& address, const QString& hostname, const ProbeCallbacks& callbacks) {
        if (!live.contains(address.toString())) {
            callbacks.finished(std::nullopt);
            return;
        }
        auto device = device_at(address, hostname);
        if (callbacks.handshake) {
            callbacks.handshake(device);
        }
        if (enrich) {
            device.capabilities = DeviceCapabilities{};
            device.capabilities->name = QStringLiteral("Voice Pi");
            device.hardware_address = QStringLiteral("B8:27:EB:00:00:2A");
        }
        callbacks.finished(device);
    }
};

class FailingAddressSpace final : public AddressSpaceEnumerator {
public:
    explicit FailingAddressSpace(bool throws) : throws_(throws) {}

    Result<std::vector<Subnet>> subnets() override {
        if (throws_) {
            throw std::runtime_error("interface table unavailable");
        }
        return Result<std::vector<Subnet>>::err(Error{"no interfaces", ErrorKind::Discovery});
    }
    QStringList well_known_hostnames() const override { return {}; }

private:
    bool throws_;
};

struct Harness {
    std::shared_ptr<StubProbe::Stats> stats = std::make_shared<StubProbe::Stats>();
    StubProbe* probe = nullptr;
    std::unique_ptr<DiscoveryEngine> engine;

    std::vector<Device> discovered;
    std::vector<Device> updated;
    int completed = 0;
    QStringList order;

    Harness(std::vector<QString> cidrs, QStringList hostnames, DiscoveryConfig config = {}) {
        std::vector<Subnet> subnets;
        for (const auto& cidr : cidrs) {
            subnets.push_back(*parse_cidr(cidr));
        }
        auto stub = std::make_unique<StubProbe>(stats);
        probe = stub.get();
        engine = std::make_unique<DiscoveryEngine>(
            std::make_unique<StaticAddressSpace>(std::move(subnets), std::move(hostnames)),
            std::move(stub), config);

        QObject::connect(engine.get(), &DiscoveryEngine::deviceDiscovered, [this](const Device& d) {
            discovered.push_back(d);
            order << QStringLiteral("discovered");
        });
        QObject::connect(engine.get(), &DiscoveryEngine::deviceUpdated, [this](const Device& d) {
            updated.push_back(d);
        });
        QObject::connect(engine.get(), &DiscoveryEngine::discoveryCompleted,
                         [this](const std::vector<Device>&) {
            ++completed;
            order << QStringLiteral("completed");
        });
    }
};

} // namespace

TEST_CASE("Discovery: the 10.0.0.42 scenario", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->live = {QStringLiteral("10.0.0.42")};

    const auto devices = h.engine->discover();

    REQUIRE(devices.size() == 1);
    CHECK(devices.front().address == QHostAddress(QStringLiteral("10.0.0.42")));
    CHECK_FALSE(devices.front().has_capabilities());
    CHECK(h.order == QStringList{QStringLiteral("discovered"), QStringLiteral("completed")});
    CHECK(h.completed == 1);
    CHECK_FALSE(h.engine->isDiscovering());
}

TEST_CASE("Discovery: no concurrent sessions", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->delay_ms = 5;

    REQUIRE(h.engine->startDiscovery());
    CHECK(h.engine->isDiscovering());

    CHECK(h.engine->discover().empty());
    CHECK_FALSE(h.engine->startDiscovery());

    REQUIRE(waitUntil([&]() { return !h.engine->isDiscovering(); }, 10000));
    CHECK(h.stats->started == 254);
    CHECK(h.completed == 1);
}

TEST_CASE("Discovery: deduplicates subnet and hostname results", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")},
              {QStringLiteral("raspberrypi.local"), QStringLiteral("pi.local")});
    h.probe->live = {QStringLiteral("10.0.0.42")};
    h.probe->names = {{QStringLiteral("raspberrypi.local"), QStringLiteral("10.0.0.42")}};

    const auto devices = h.engine->discover();

    REQUIRE(devices.size() == 1);
    CHECK(devices.front().key() == QStringLiteral("10.0.0.42:8000"));
    CHECK(devices.front().hostname == QStringLiteral("raspberrypi.local"));
    CHECK(h.discovered.size() == 1);
    CHECK_FALSE(h.updated.empty());
    CHECK(h.stats->hostname_probes == 2);
}

TEST_CASE("Discovery: at most one batch in flight per subnet", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->delay_ms = 2;

    h.engine->discover();

    CHECK(h.stats->started == 254);
    CHECK(h.stats->max_in_flight <= 50);
    CHECK(h.stats->max_in_flight == 50);
}

TEST_CASE("Discovery: batch size follows the configuration", "[integration][discovery]") {
    DiscoveryConfig config;
    config.batch_size = 16;
    Harness h({QStringLiteral("10.0.0.0/24")}, {}, config);
    h.probe->delay_ms = 1;

    h.engine->discover();

    CHECK(h.stats->started == 254);
    CHECK(h.stats->max_in_flight == 16);
}

TEST_CASE("Discovery: subnets are scanned in parallel", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24"), QStringLiteral("192.168.1.0/24")}, {});
    h.probe->delay_ms = 2;
    h.probe->live = {QStringLiteral("10.0.0.42"), QStringLiteral("192.168.1.20")};

    const auto devices = h.engine->discover();

    CHECK(devices.size() == 2);
    CHECK(h.stats->started == 508);
    CHECK(h.stats->max_in_flight == 100);
}

TEST_CASE("Discovery: synchronous probes still complete once", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {QStringLiteral("pi.local")});
    h.probe->delay_ms = -1;
    h.probe->live = {QStringLiteral("10.0.0.1"), QStringLiteral("10.0.0.254")};

    const auto devices = h.engine->discover();

    CHECK(devices.size() == 2);
    CHECK(h.stats->started == 254);
    CHECK(h.completed == 1);
}

TEST_CASE("Discovery: enrichment arrives as an update", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->live = {QStringLiteral("10.0.0.42")};
    h.probe->enrich = true;

    const auto devices = h.engine->discover();

    REQUIRE(h.discovered.size() == 1);
    CHECK_FALSE(h.discovered.front().has_capabilities());
    REQUIRE(h.updated.size() == 1);
    CHECK(h.updated.front().has_capabilities());

    REQUIRE(devices.size() == 1);
    CHECK(devices.front().display_name() == QStringLiteral("Voice Pi"));
    CHECK(devices.front().hardware_address == QStringLiteral("B8:27:EB:00:00:2A"));
}

TEST_CASE("Discovery: nothing to scan completes immediately", "[integration][discovery]") {
    Harness h({}, {});

    CHECK(h.engine->discover().empty());
    CHECK(h.completed == 1);
    CHECK_FALSE(h.engine->isDiscovering());
}

TEST_CASE("Discovery: enumeration failure fails the session", "[integration][discovery]") {
    for (bool throws : {false, true}) {
        DYNAMIC_SECTION("throws: " << throws) {
            auto stats = std::make_shared<StubProbe::Stats>();
            DiscoveryEngine engine(std::make_unique<FailingAddressSpace>(throws),
                                   std::make_unique<StubProbe>(stats));
            QStringList failures;
            int completed = 0;
            QObject::connect(&engine, &DiscoveryEngine::discoveryFailed,
                             [&](const QString& message) { failures << message; });
            QObject::connect(&engine, &DiscoveryEngine::discoveryCompleted,
                             [&](const std::vector<Device>&) { ++completed; });

            CHECK(engine.discover().empty());
            CHECK(failures.size() == 1);
            CHECK(completed == 0);
            CHECK(stats->started == 0);
            CHECK_FALSE(engine.isDiscovering());
        }
    }
}

TEST_CASE("Discovery: a new session can follow a finished one", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->live = {QStringLiteral("10.0.0.42")};

    CHECK(h.engine->discover().size() == 1);
    h.probe->live = {QStringLiteral("10.0.0.43"), QStringLiteral("10.0.0.44")};
    CHECK(h.engine->discover().size() == 2);
    CHECK(h.completed == 2);
    CHECK(h.engine->lastDevices().size() == 2);
}

TEST_CASE("Discovery: findDevice probes one hostname", "[integration][discovery]") {
    Harness h({QStringLiteral("10.0.0.0/24")}, {});
    h.probe->live = {QStringLiteral("10.0.0.42")};
    h.probe->names = {{QStringLiteral("voice-pi.local"), QStringLiteral("10.0.0.42")}};

    auto found = h.engine->findDevice(QStringLiteral("voice-pi.local"));
    REQUIRE(found.has_value());
    CHECK(found->hostname == QStringLiteral("voice-pi.local"));

    CHECK_FALSE(h.engine->findDevice(QStringLiteral("unknown.local")).has_value());
    CHECK_FALSE(h.engine->findDevice(QStringLiteral("   ")).has_value());
    CHECK(h.discovered.empty());
    CHECK(h.completed == 0);
    CHECK(h.stats->started == 0);
}
