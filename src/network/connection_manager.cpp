#include "network/connection_manager.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QPointer>

namespace voxlink::network {

namespace {

// How long a gracefully closing transport may linger before it is deleted.
constexpr int kCloseGraceMs = 1000;

Result<void> not_connected() {
    return Result<void>::err(Error("Not connected", ErrorKind::NotConnected));
}

} // namespace

const char* state_name(ConnectionManager::State state) {
    switch (state) {
        case ConnectionManager::State::Disconnected: return "Disconnected";
        case ConnectionManager::State::Connecting: return "Connecting";
        case ConnectionManager::State::Connected: return "Connected";
        case ConnectionManager::State::Disconnecting: return "Disconnecting";
        case ConnectionManager::State::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

ConnectionManager::ConnectionManager(ConnectionConfig config, TransportFactory factory,
                                     QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , factory_(std::move(factory))
    , policy_(config_)
    , connect_timer_(new QTimer(this))
    , heartbeat_timer_(new QTimer(this))
    , reconnect_timer_(new QTimer(this))
{
    qRegisterMetaType<voxlink::protocol::RecognitionResult>();

    connect_timer_->setSingleShot(true);
    reconnect_timer_->setSingleShot(true);

    connect(connect_timer_, &QTimer::timeout, this, &ConnectionManager::onConnectTimeout);
    connect(heartbeat_timer_, &QTimer::timeout, this, &ConnectionManager::onHeartbeat);
    connect(reconnect_timer_, &QTimer::timeout, this, &ConnectionManager::onReconnectTimer);
}

ConnectionManager::~ConnectionManager() {
    ++generation_;
    heartbeat_timer_->stop();
    reconnect_timer_->stop();
    connect_timer_->stop();
    // Unblocks a connectToDevice() still waiting further up the stack.
    finishAttempt(AttemptOutcome::Cancelled, QStringLiteral("Connection manager destroyed"));
    if (transport_) {
        transport_->QObject::disconnect(this);
        transport_->abort();
    }
}

QUrl ConnectionManager::streamUrl() const {
    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(host_);
    url.setPort(port_);
    url.setPath(config_.stream_path);
    return url;
}

bool ConnectionManager::connectToDevice(const Device& device) {
    const auto host = device.address.isNull() ? device.hostname : device.address.toString();
    return connectTo(host, device.port, device);
}

bool ConnectionManager::connectToDevice(const QString& host, uint16_t port) {
    return connectTo(host, port, std::nullopt);
}

bool ConnectionManager::connectTo(const QString& host, uint16_t port, std::optional<Device> target) {
    if (host.trimmed().isEmpty() || port == 0) {
        last_error_ = QStringLiteral("Invalid host or port");
        qCWarning(lcConnection) << "Refusing to connect:" << last_error_ << host << port;
        emit connectionFailed(last_error_);
        return false;
    }

    if (state_ != State::Disconnected) {
        qCInfo(lcConnection) << "Dropping current connection before connecting to" << host;
        disconnect();
    }

    host_ = host.trimmed();
    port_ = port;
    target_device_ = std::move(target);
    reconnect_attempt_ = 0;
    policy_.reset();

    QPointer<ConnectionManager> self(this);
    const quint64 generation = generation_;
    setState(State::Connecting);
    // A stateChanged listener may have called disconnect().
    if (!self) return false;
    if (generation != generation_ || state_ != State::Connecting) {
        qCInfo(lcConnection) << "Connect to" << host_ << "cancelled before it started";
        return false;
    }

    bool settled = false;
    bool opened = false;
    QEventLoop loop;

    startAttempt([this, &settled, &opened, &loop](AttemptOutcome outcome, const QString& reason) {
        switch (outcome) {
            case AttemptOutcome::Opened:
                enterConnected();
                opened = true;
                break;
            case AttemptOutcome::Failed:
                failConnect(reason);
                break;
            case AttemptOutcome::Cancelled:
                qCInfo(lcConnection) << "Connect cancelled:" << reason;
                break;
        }
        settled = true;
        loop.quit();
    });

    if (!settled) {
        loop.exec();
    }
    if (!self) {
        return false;
    }
    return opened;
}

void ConnectionManager::disconnect() {
    if (state_ == State::Disconnected || state_ == State::Disconnecting) {
        return;
    }

    const State previous = state_;
    ++generation_;
    heartbeat_timer_->stop();
    reconnect_timer_->stop();
    connect_timer_->stop();

    setState(State::Disconnecting);
    releaseTransport(true);
    finishAttempt(AttemptOutcome::Cancelled, QStringLiteral("Disconnected by request"));
    setState(State::Disconnected);

    qCInfo(lcConnection) << "Disconnected from" << host_;
    if (previous == State::Connected) {
        emit disconnected();
    }
}

Result<void> ConnectionManager::sendBinary(const QByteArray& payload) {
    if (state_ != State::Connected || !transport_) {
        return not_connected();
    }
    if (transport_->sendBinary(payload) < 0) {
        return Result<void>::err(Error("Failed to send binary frame", ErrorKind::Transport));
    }
    return Result<void>::ok();
}

Result<void> ConnectionManager::sendText(const QString& text) {
    if (state_ != State::Connected || !transport_) {
        return not_connected();
    }
    if (transport_->sendText(text) < 0) {
        return Result<void>::err(Error("Failed to send text frame", ErrorKind::Transport));
    }
    return Result<void>::ok();
}

Result<void> ConnectionManager::sendMessage(const protocol::Message& message) {
    return sendText(QString::fromUtf8(protocol::encode_message(message)));
}

void ConnectionManager::setState(State state) {
    if (state_ == state) {
        return;
    }
    const State old_state = state_;
    state_ = state;
    qCDebug(lcConnection) << "State" << state_name(old_state) << "->" << state_name(state);
    emit stateChanged(old_state, state);
}

void ConnectionManager::startAttempt(AttemptCallback done) {
    releaseTransport(false);

    const quint64 generation = ++generation_;
    attempt_done_ = std::move(done);

    transport_ = factory_ ? factory_() : nullptr;
    if (!transport_) {
        finishAttempt(AttemptOutcome::Failed, QStringLiteral("No transport available"));
        return;
    }

    auto* transport = transport_.get();
    connect(transport, &StreamTransport::opened, this, [this, generation]() {
        if (generation != generation_) return;
        connect_timer_->stop();
        finishAttempt(AttemptOutcome::Opened, QString());
    });
    connect(transport, &StreamTransport::closed, this,
            [this, generation](bool clean, const QString& reason) {
        onTransportClosed(generation, clean, reason);
    });
    connect(transport, &StreamTransport::errorOccurred, this,
            [this, generation](const QString& message) {
        onTransportError(generation, message);
    });
    connect(transport, &StreamTransport::textReceived, this,
            [this, generation](const QString& text) {
        onTextReceived(generation, text);
    });
    connect(transport, &StreamTransport::binaryReceived, this,
            [this, generation](const QByteArray& payload) {
        onBinaryReceived(generation, payload);
    });

    const QUrl url = streamUrl();
    qCInfo(lcConnection) << "Connecting to" << url.toString();
    connect_timer_->start(config_.connect_timeout);
    transport->open(url);
}

void ConnectionManager::finishAttempt(AttemptOutcome outcome, const QString& reason) {
    if (!attempt_done_) {
        return;
    }
    connect_timer_->stop();
    auto done = std::move(attempt_done_);
    attempt_done_ = nullptr;
    done(outcome, reason);
}

void ConnectionManager::releaseTransport(bool graceful) {
    connect_timer_->stop();
    if (!transport_) {
        return;
    }

    StreamTransport* transport = transport_.release();
    transport->QObject::disconnect(this);
    if (graceful && transport->isOpen()) {
        // Let the close handshake go out before the socket is deleted.
        connect(transport, &StreamTransport::closed, transport, &QObject::deleteLater);
        QTimer::singleShot(kCloseGraceMs, transport, &QObject::deleteLater);
        transport->close(QStringLiteral("Client disconnect"));
    } else {
        transport->abort();
        transport->deleteLater();
    }
}

void ConnectionManager::enterConnected() {
    reconnect_attempt_ = 0;
    policy_.reset();
    last_error_.clear();
    last_heartbeat_ = Timestamp::now();

    setState(State::Connected);
    heartbeat_timer_->start(config_.heartbeat_interval);
    qCInfo(lcConnection) << "Connected to" << streamUrl().toString();
    emit connected();
}

void ConnectionManager::failConnect(const QString& reason) {
    releaseTransport(false);
    last_error_ = reason;
    setState(State::Disconnected);
    qCWarning(lcConnection) << "Failed to connect to" << streamUrl().toString() << reason;
    emit connectionFailed(reason);
}

void ConnectionManager::connectionLost(const QString& reason) {
    heartbeat_timer_->stop();
    releaseTransport(false);
    last_error_ = reason;
    qCWarning(lcConnection) << "Connection to" << host_ << "lost:" << reason;

    setState(State::Reconnecting);
    emit disconnected();
    // A listener may have called disconnect() in the meantime.
    if (state_ != State::Reconnecting) {
        return;
    }
    scheduleReconnect();
}

void ConnectionManager::scheduleReconnect() {
    if (reconnect_attempt_ >= config_.max_reconnect_attempts) {
        giveUp();
        return;
    }
    const Millis delay = policy_.next_delay();
    qCInfo(lcConnection) << "Reconnecting in" << delay.count() << "ms (attempt"
                         << reconnect_attempt_ + 1 << "of" << config_.max_reconnect_attempts << ")";
    reconnect_timer_->start(delay);
}

void ConnectionManager::onReconnectTimer() {
    if (state_ != State::Reconnecting) {
        return;
    }

    ++reconnect_attempt_;
    const quint64 generation = generation_;
    emit reconnectAttemptStarted(reconnect_attempt_, config_.max_reconnect_attempts);
    if (generation != generation_ || state_ != State::Reconnecting) {
        qCDebug(lcConnection) << "Reconnect attempt" << reconnect_attempt_ << "cancelled by a listener";
        return;
    }

    startAttempt([this](AttemptOutcome outcome, const QString& reason) {
        switch (outcome) {
            case AttemptOutcome::Opened:
                qCInfo(lcConnection) << "Reconnected after" << reconnect_attempt_ << "attempt(s)";
                enterConnected();
                break;
            case AttemptOutcome::Failed:
                qCWarning(lcConnection) << "Reconnect attempt" << reconnect_attempt_
                                        << "failed:" << reason;
                last_error_ = reason;
                releaseTransport(false);
                scheduleReconnect();
                break;
            case AttemptOutcome::Cancelled:
                break;
        }
    });
}

void ConnectionManager::giveUp() {
    reconnect_timer_->stop();
    releaseTransport(false);
    last_error_ = QStringLiteral("Reconnection failed after %1 attempt(s)").arg(reconnect_attempt_);
    qCCritical(lcConnection) << last_error_;
    setState(State::Disconnected);
    emit reconnectFailed();
}

void ConnectionManager::onConnectTimeout() {
    if (!attempt_done_) {
        return;
    }
    finishAttempt(AttemptOutcome::Failed,
                  QStringLiteral("Connection timed out after %1 ms").arg(config_.connect_timeout.count()));
}

void ConnectionManager::onHeartbeat() {
    if (state_ != State::Connected) {
        heartbeat_timer_->stop();
        return;
    }

    const auto silence = Timestamp::now() - last_heartbeat_;
    if (silence > config_.heartbeat_dead_threshold()) {
        connectionLost(QStringLiteral("No traffic for %1 ms").arg(silence.count()));
        return;
    }

    auto sent = sendMessage(protocol::make_ping());
    if (sent.is_err()) {
        qCWarning(lcConnection) << "Heartbeat ping failed:" << sent.unwrap_err().message.c_str();
    }
}

void ConnectionManager::onTransportClosed(quint64 generation, bool clean, const QString& reason) {
    if (generation != generation_) {
        return;
    }

    if (attempt_done_) {
        finishAttempt(AttemptOutcome::Failed, reason);
        return;
    }
    if (state_ == State::Connected) {
        // Only disconnect() closes cleanly, and it detaches the transport first.
        qCDebug(lcConnection) << "Transport closed while connected, clean:" << clean;
        connectionLost(reason);
    }
}

void ConnectionManager::onTransportError(quint64 generation, const QString& message) {
    if (generation != generation_) {
        return;
    }

    last_error_ = message;
    emit errorOccurred(message);
    if (attempt_done_) {
        finishAttempt(AttemptOutcome::Failed, message);
    }
}

void ConnectionManager::onTextReceived(quint64 generation, const QString& text) {
    if (generation != generation_) {
        return;
    }
    last_heartbeat_ = Timestamp::now();

    auto decoded = protocol::decode_message(text.toUtf8());
    if (decoded.is_err()) {
        qCWarning(lcProtocol) << "Dropping malformed message:" << decoded.unwrap_err().message.c_str();
        return;
    }
    dispatch(decoded.unwrap());
}

void ConnectionManager::onBinaryReceived(quint64 generation, const QByteArray& payload) {
    if (generation != generation_) {
        return;
    }
    last_heartbeat_ = Timestamp::now();
    emit binaryReceived(payload);
}

void ConnectionManager::dispatch(const protocol::Message& message) {
    switch (message.kind()) {
        case protocol::MessageKind::Ping: {
            auto sent = sendMessage(protocol::make_pong());
            if (sent.is_err()) {
                qCWarning(lcConnection) << "Failed to answer ping:" << sent.unwrap_err().message.c_str();
            }
            break;
        }
        case protocol::MessageKind::Pong:
            qCDebug(lcConnection) << "Pong received";
            break;
        case protocol::MessageKind::RecognitionResult: {
            auto result = protocol::decode_recognition_result(message.data);
            if (result.is_err()) {
                qCWarning(lcProtocol) << "Dropping recognition result:"
                                      << result.unwrap_err().message.c_str();
                break;
            }
            emit recognitionResultReceived(result.unwrap());
            break;
        }
        case protocol::MessageKind::Error: {
            const auto text = protocol::error_text(message.data);
            qCWarning(lcConnection) << "Server error:" << text;
            emit serverError(text);
            break;
        }
        case protocol::MessageKind::Unknown:
            qCDebug(lcProtocol) << "Ignoring message of type" << message.type;
            break;
    }
}

} // namespace voxlink::network
