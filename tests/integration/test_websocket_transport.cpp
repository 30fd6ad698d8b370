#include <catch2/catch_test_macros.hpp>
#include "network/connection_manager.hpp"
#include "../test_support.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>
#include <QSignalSpy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QWebSocket>
#include <QWebSocketServer>

using namespace voxlink;
using namespace voxlink::network;
using voxlink::testing::waitUntil;
using State = ConnectionManager::State;

namespace {

/**
 * Loopback WebSocket server standing in for the device's stream endpoint.
 */
class StreamServer {
public:
    StreamServer() : server_(QStringLiteral("voxlink-test"), QWebSocketServer::NonSecureMode) {
        REQUIRE(server_.listen(QHostAddress::LocalHost, 0));
        QObject::connect(&server_, &QWebSocketServer::newConnection, [this]() {
            while (auto* socket = server_.nextPendingConnection()) {
                socket->setParent(&server_);
                paths << socket->requestUrl().path();
                QObject::connect(socket, &QWebSocket::textMessageReceived, [this](const QString& text) {
                    received << text;
                });
                clients << socket;
            }
        });
    }

    [[nodiscard]] uint16_t port() const { return server_.serverPort(); }

    QWebSocket* last() const {
        return clients.isEmpty() ? nullptr : clients.last().data();
    }

    int count_received(const char* type) const {
        int n = 0;
        for (const auto& text : received) {
            const auto obj = QJsonDocument::fromJson(text.toUtf8()).object();
            if (obj.value(QStringLiteral("type")).toString() == QLatin1String(type)) ++n;
        }
        return n;
    }

    QStringList paths;
    QStringList received;
    QList<QPointer<QWebSocket>> clients;

private:
    QWebSocketServer server_;
};

ConnectionConfig loopback_config() {
    ConnectionConfig config;
    config.connect_timeout = Millis(2000);
    config.heartbeat_interval = Millis(10000);
    config.reconnect_delay = Millis(20);
    config.max_reconnect_attempts = 3;
    return config;
}

} // namespace

TEST_CASE("WebSocket: connects to the stream path and exchanges messages", "[integration][websocket]") {
    StreamServer server;
    ConnectionManager manager(loopback_config());
    QSignalSpy results(&manager, &ConnectionManager::recognitionResultReceived);

    REQUIRE(manager.connectToDevice(QStringLiteral("127.0.0.1"), server.port()));
    REQUIRE(waitUntil([&]() { return server.last() != nullptr; }));
    CHECK(server.paths.front() == QStringLiteral("/ws/audio"));

    server.last()->sendTextMessage(QStringLiteral(R"({"type":"ping"})"));
    REQUIRE(waitUntil([&]() { return server.count_received("pong") == 1; }));

    server.last()->sendTextMessage(QStringLiteral(
        R"({"type":"recognition_result","data":{"speaker_id":"spk-7","speaker_name":"Bob","confidence":88.5}})"));
    REQUIRE(waitUntil([&]() { return results.count() == 1; }));
    const auto result = results.at(0).at(0).value<protocol::RecognitionResult>();
    CHECK(result.speaker_id == QStringLiteral("spk-7"));

    REQUIRE(manager.sendBinary(QByteArray(320, '\0')).is_ok());

    manager.disconnect();
    CHECK(manager.state() == State::Disconnected);
}

TEST_CASE("WebSocket: a server that never upgrades fails the connect", "[integration][websocket]") {
    QTcpServer silent;
    REQUIRE(silent.listen(QHostAddress::LocalHost, 0));
    QList<QTcpSocket*> held;
    QObject::connect(&silent, &QTcpServer::newConnection, [&]() {
        while (auto* socket = silent.nextPendingConnection()) {
            held << socket;
        }
    });

    auto config = loopback_config();
    config.connect_timeout = Millis(300);
    ConnectionManager manager(config);
    QSignalSpy connected(&manager, &ConnectionManager::connected);

    CHECK_FALSE(manager.connectToDevice(QStringLiteral("127.0.0.1"), silent.serverPort()));
    CHECK(manager.state() == State::Disconnected);
    CHECK(connected.count() == 0);
    CHECK_FALSE(manager.lastError().isEmpty());
}

TEST_CASE("WebSocket: nothing listening fails the connect", "[integration][websocket]") {
    uint16_t port = 0;
    {
        QTcpServer probe;
        REQUIRE(probe.listen(QHostAddress::LocalHost, 0));
        port = probe.serverPort();
    }

    ConnectionManager manager(loopback_config());
    QSignalSpy failed(&manager, &ConnectionManager::connectionFailed);

    CHECK_FALSE(manager.connectToDevice(QStringLiteral("127.0.0.1"), port));
    CHECK(manager.state() == State::Disconnected);
    CHECK(failed.count() == 1);
}

TEST_CASE("WebSocket: a server-side close triggers a reconnect", "[integration][websocket]") {
    StreamServer server;
    ConnectionManager manager(loopback_config());
    QSignalSpy attempts(&manager, &ConnectionManager::reconnectAttemptStarted);
    QSignalSpy disconnected(&manager, &ConnectionManager::disconnected);

    REQUIRE(manager.connectToDevice(QStringLiteral("127.0.0.1"), server.port()));
    REQUIRE(waitUntil([&]() { return server.last() != nullptr; }));

    server.last()->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("restarting"));

    REQUIRE(waitUntil([&]() { return disconnected.count() == 1; }));
    REQUIRE(waitUntil([&]() { return manager.state() == State::Connected; }, 3000));
    CHECK(attempts.count() >= 1);
    CHECK(waitUntil([&]() { return server.clients.size() == 2; }));
    CHECK(manager.reconnectAttempt() == 0);

    manager.disconnect();
}
