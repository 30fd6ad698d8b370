#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUrl>
#include <functional>
#include <memory>

class QWebSocket;

namespace voxlink::network {

/**
 * StreamTransport - A message-oriented, full-duplex link to a device.
 *
 * One instance carries one connection attempt. `closed` reports whether
 * the close was clean, i.e. initiated by this side through close().
 */
class StreamTransport : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~StreamTransport() override = default;

    virtual void open(const QUrl& url) = 0;

    /**
     * Start a normal close handshake. `closed(true, ...)` follows.
     */
    virtual void close(const QString& reason = QString()) = 0;

    /**
     * Drop the link immediately, without a close handshake.
     */
    virtual void abort() = 0;

    // Return the number of bytes handed to the link, or -1 on failure.
    virtual qint64 sendText(const QString& text) = 0;
    virtual qint64 sendBinary(const QByteArray& payload) = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

signals:
    void opened();
    void closed(bool clean, const QString& reason);
    void textReceived(const QString& text);
    void binaryReceived(const QByteArray& payload);
    void errorOccurred(const QString& message);
};

using TransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

/**
 * WebSocketTransport - StreamTransport over QWebSocket.
 */
class WebSocketTransport final : public StreamTransport {
    Q_OBJECT

public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    void open(const QUrl& url) override;
    void close(const QString& reason = QString()) override;
    void abort() override;
    qint64 sendText(const QString& text) override;
    qint64 sendBinary(const QByteArray& payload) override;
    [[nodiscard]] bool isOpen() const override;

private:
    QWebSocket* socket_;
    bool closing_ = false;

    void onDisconnected();
};

/**
 * Factory producing WebSocketTransport instances.
 */
TransportFactory websocket_transport_factory();

} // namespace voxlink::network
