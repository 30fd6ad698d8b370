#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/device.hpp"
#include "network/reconnect_policy.hpp"
#include "network/stream_transport.hpp"
#include "protocol/message_codec.hpp"
#include "protocol/recognition_result.hpp"

#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>

namespace voxlink::network {

/**
 * ConnectionManager - The streaming link to one device.
 *
 * Owns the transport, the heartbeat and the reconnect loop. Every state
 * change happens on the thread the manager lives on. Asynchronous steps
 * carry the generation they were started in; a step whose generation is
 * stale does nothing, which is how disconnect() cancels an in-flight
 * connect or reconnect.
 */
class ConnectionManager : public QObject {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Disconnecting,
        Reconnecting
    };
    Q_ENUM(State)

    explicit ConnectionManager(ConnectionConfig config = {},
                               TransportFactory factory = websocket_transport_factory(),
                               QObject* parent = nullptr);
    ~ConnectionManager() override;

    /**
     * Connect to ws://host:port<stream_path>.
     *
     * Disconnects first when a connection exists or is being made. Spins
     * a local event loop until the link opens, fails or the connect
     * timeout elapses. On failure the state is Disconnected, lastError()
     * holds the reason and connectionFailed has been emitted.
     */
    bool connectToDevice(const QString& host, uint16_t port);

    /**
     * Connect to the device's address (its hostname when the address is
     * unknown). The record stays available through targetDevice().
     */
    bool connectToDevice(const Device& device);

    /**
     * Close the link cleanly and stop all timers. Idempotent.
     */
    void disconnect();

    Result<void> sendBinary(const QByteArray& payload);
    Result<void> sendText(const QString& text);
    Result<void> sendMessage(const protocol::Message& message);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] const QString& lastError() const { return last_error_; }
    [[nodiscard]] int reconnectAttempt() const { return reconnect_attempt_; }
    [[nodiscard]] Timestamp lastHeartbeatAt() const { return last_heartbeat_; }
    [[nodiscard]] const QString& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }
    // Set only when connected through connectToDevice(const Device&).
    [[nodiscard]] const std::optional<Device>& targetDevice() const { return target_device_; }
    [[nodiscard]] const ConnectionConfig& config() const { return config_; }

    [[nodiscard]] QUrl streamUrl() const;

signals:
    void stateChanged(voxlink::network::ConnectionManager::State old_state,
                      voxlink::network::ConnectionManager::State new_state);
    void connected();
    void disconnected();
    void connectionFailed(const QString& reason);
    void reconnectAttemptStarted(int attempt, int max_attempts);
    void reconnectFailed();

    void recognitionResultReceived(const voxlink::protocol::RecognitionResult& result);
    void serverError(const QString& message);
    void errorOccurred(const QString& message);
    void binaryReceived(const QByteArray& payload);

private:
    enum class AttemptOutcome {
        Opened,
        Failed,
        Cancelled
    };
    using AttemptCallback = std::function<void(AttemptOutcome, const QString&)>;

    ConnectionConfig config_;
    TransportFactory factory_;
    ReconnectPolicy policy_;

    State state_ = State::Disconnected;
    std::unique_ptr<StreamTransport> transport_;
    quint64 generation_ = 0;
    AttemptCallback attempt_done_;

    QTimer* connect_timer_;
    QTimer* heartbeat_timer_;
    QTimer* reconnect_timer_;

    QString host_;
    uint16_t port_ = 0;
    std::optional<Device> target_device_;
    QString last_error_;
    int reconnect_attempt_ = 0;
    Timestamp last_heartbeat_;

    bool connectTo(const QString& host, uint16_t port, std::optional<Device> target);
    void setState(State state);

    void startAttempt(AttemptCallback done);
    void finishAttempt(AttemptOutcome outcome, const QString& reason);
    void releaseTransport(bool graceful);

    void enterConnected();
    void failConnect(const QString& reason);
    void connectionLost(const QString& reason);
    void scheduleReconnect();
    void onReconnectTimer();
    void giveUp();

    void onConnectTimeout();
    void onHeartbeat();
    void onTransportClosed(quint64 generation, bool clean, const QString& reason);
    void onTransportError(quint64 generation, const QString& message);
    void onTextReceived(quint64 generation, const QString& text);
    void onBinaryReceived(quint64 generation, const QByteArray& payload);
    void dispatch(const protocol::Message& message);
};

[[nodiscard]] const char* state_name(ConnectionManager::State state);

} // namespace voxlink::network
