#include "network/stream_transport.hpp"
#include "core/logging.hpp"

#include <QNetworkProxy>
#include <QWebSocket>

namespace voxlink::network {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : StreamTransport(parent)
    , socket_(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
{
    // Devices are on the local segment.
    socket_->setProxy(QNetworkProxy::NoProxy);

    connect(socket_, &QWebSocket::connected, this, &StreamTransport::opened);
    connect(socket_, &QWebSocket::disconnected, this, &WebSocketTransport::onDisconnected);
    connect(socket_, &QWebSocket::textMessageReceived, this, &StreamTransport::textReceived);
    connect(socket_, &QWebSocket::binaryMessageReceived, this, &StreamTransport::binaryReceived);
    connect(socket_, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit errorOccurred(socket_->errorString());
    });
}

WebSocketTransport::~WebSocketTransport() {
    socket_->disconnect(this);
}

void WebSocketTransport::open(const QUrl& url) {
    closing_ = false;
    socket_->open(url);
}

void WebSocketTransport::close(const QString& reason) {
    if (socket_->state() == QAbstractSocket::UnconnectedState) {
        return;
    }
    closing_ = true;
    socket_->close(QWebSocketProtocol::CloseCodeNormal, reason);
}

void WebSocketTransport::abort() {
    closing_ = true;
    socket_->abort();
}

qint64 WebSocketTransport::sendText(const QString& text) {
    if (!isOpen()) return -1;
    return socket_->sendTextMessage(text);
}

qint64 WebSocketTransport::sendBinary(const QByteArray& payload) {
    if (!isOpen()) return -1;
    return socket_->sendBinaryMessage(payload);
}

bool WebSocketTransport::isOpen() const {
    return socket_->state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::onDisconnected() {
    const bool clean = closing_;
    closing_ = false;

    QString reason = socket_->closeReason();
    if (reason.isEmpty() && socket_->error() != QAbstractSocket::UnknownSocketError) {
        reason = socket_->errorString();
    }
    if (reason.isEmpty()) {
        reason = clean ? QStringLiteral("Closed") : QStringLiteral("Connection closed by peer");
    }
    qCDebug(lcConnection) << "WebSocket closed, clean:" << clean << "code:"
                          << socket_->closeCode() << reason;
    emit closed(clean, reason);
}

TransportFactory websocket_transport_factory() {
    return []() -> std::unique_ptr<StreamTransport> {
        return std::make_unique<WebSocketTransport>();
    };
}

} // namespace voxlink::network
