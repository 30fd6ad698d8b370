#include "network/host_probe.hpp"
#include "network/neighbor_table.hpp"
#include "core/logging.hpp"

#include <QHostInfo>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QProcess>
#include <QTcpSocket>
#include <QTimer>
#include <QUrl>

#include <algorithm>
#include <memory>

namespace voxlink::network {

/**
 * ProbeTask - One in-flight probe. Deletes itself after reporting.
 */
class ProbeTask : public QObject {
public:
    ProbeTask(NetworkHostProbe& owner, QHostAddress address, QString hostname,
              ProbeCallbacks callbacks)
        : QObject(&owner)
        , owner_(owner)
        , address_(std::move(address))
        , hostname_(std::move(hostname))
        , callbacks_(std::move(callbacks))
        , timer_(new QTimer(this))
    {
        timer_->setSingleShot(true);
    }

    void start(bool check_reachability) {
        if (check_reachability) {
            checkReachability();
        } else {
            handshake();
        }
    }

private:
    NetworkHostProbe& owner_;
    QHostAddress address_;
    QString hostname_;
    ProbeCallbacks callbacks_;
    QTimer* timer_;
    Device device_;
    // Bumped at the start of every step; late signals from an earlier step are ignored.
    int step_ = 0;
    bool done_ = false;

    const DiscoveryConfig& config() const { return owner_.config_; }

    void armTimer(Millis timeout, std::function<void()> on_timeout) {
        timer_->disconnect();
        connect(timer_, &QTimer::timeout, this, std::move(on_timeout));
        timer_->start(timeout);
    }

    void checkReachability() {
        const int step = ++step_;
        auto* process = new QProcess(this);

#ifdef Q_OS_WIN
        const QStringList args{QStringLiteral("-n"), QStringLiteral("1"),
                               QStringLiteral("-w"),
                               QString::number(config().reachability_timeout.count()),
                               address_.toString()};
#else
        const auto wait_s = std::max<long long>(1, (config().reachability_timeout.count() + 999) / 1000);
        const QStringList args{QStringLiteral("-c"), QStringLiteral("1"),
                               QStringLiteral("-W"), QString::number(wait_s),
                               address_.toString()};
#endif

        connect(process, &QProcess::finished, this,
                [this, step, process](int exit_code, QProcess::ExitStatus status) {
            if (step != step_) return;
            process->deleteLater();
            if (status == QProcess::NormalExit && exit_code == 0) {
                handshake();
            } else {
                finish(std::nullopt);
            }
        });
        connect(process, &QProcess::errorOccurred, this,
                [this, step, process](QProcess::ProcessError err) {
            if (step != step_ || err != QProcess::FailedToStart) return;
            process->deleteLater();
            qCDebug(lcDiscovery) << "Reachability tool" << config().ping_program
                                 << "unavailable; probing" << address_.toString() << "directly";
            handshake();
        });

        // Grace period on top of ping's own wait for process start-up.
        armTimer(config().reachability_timeout + Millis(500), [this, step, process]() {
            if (step != step_) return;
            process->disconnect(this);
            process->kill();
            process->deleteLater();
            finish(std::nullopt);
        });

        process->start(config().ping_program, args);
    }

    void handshake() {
        const int step = ++step_;
        auto* socket = new QTcpSocket(this);

        connect(socket, &QTcpSocket::connected, this, [this, step, socket]() {
            if (step != step_) return;
            timer_->stop();
            socket->abort();
            socket->deleteLater();

            device_.address = address_;
            device_.hostname = hostname_;
            device_.port = config().service_port;
            device_.last_seen = Timestamp::now();
            if (callbacks_.handshake) {
                callbacks_.handshake(device_);
            }
            fetchCapabilities();
        });
        connect(socket, &QTcpSocket::errorOccurred, this,
                [this, step, socket](QAbstractSocket::SocketError) {
            if (step != step_) return;
            qCDebug(lcDiscovery) << "Handshake failed for" << address_.toString()
                                 << socket->errorString();
            socket->deleteLater();
            finish(std::nullopt);
        });

        armTimer(config().handshake_timeout, [this, step, socket]() {
            if (step != step_) return;
            socket->disconnect(this);
            socket->abort();
            socket->deleteLater();
            finish(std::nullopt);
        });

        socket->connectToHost(address_, config().service_port);
    }

    void fetchCapabilities() {
        const int step = ++step_;

        QUrl url;
        url.setScheme(QStringLiteral("http"));
        url.setHost(address_.toString());
        url.setPort(config().service_port);
        url.setPath(config().status_path);

        QNetworkRequest request(url);
        request.setTransferTimeout(static_cast<int>(config().capability_timeout.count()));
        auto* reply = owner_.http_->get(request);

        connect(reply, &QNetworkReply::finished, this, [this, step, reply]() {
            reply->deleteLater();
            if (step != step_) return;
            timer_->stop();

            const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            if (reply->error() != QNetworkReply::NoError || status < 200 || status >= 300) {
                qCDebug(lcDiscovery) << "No capabilities from" << address_.toString()
                                     << "status" << status << reply->errorString();
            } else {
                auto caps = decode_capabilities(reply->readAll());
                if (caps.is_ok()) {
                    device_.capabilities = std::move(caps).unwrap();
                } else {
                    qCDebug(lcDiscovery) << "Malformed capabilities from" << address_.toString()
                                         << caps.unwrap_err().message.c_str();
                }
            }
            lookupHardwareAddress();
        });

        // The transfer timeout only catches a stalled reply; this bounds a trickling one.
        armTimer(config().capability_timeout, [this, step, reply]() {
            if (step != step_) return;
            qCDebug(lcDiscovery) << "Capability fetch from" << address_.toString() << "timed out";
            reply->disconnect(this);
            reply->abort();
            reply->deleteLater();
            lookupHardwareAddress();
        });
    }

    void lookupHardwareAddress() {
        ++step_;
        QPointer<ProbeTask> self(this);
        owner_.neighbors_->lookup(address_, [self](QString mac) {
            if (!self) return;
            self->device_.hardware_address = std::move(mac);
            self->finish(self->device_);
        });
    }

    void finish(std::optional<Device> device) {
        if (done_) return;
        done_ = true;
        ++step_;
        timer_->stop();

        auto finished = std::move(callbacks_.finished);
        deleteLater();
        if (finished) {
            finished(std::move(device));
        }
    }
};

NetworkHostProbe::NetworkHostProbe(DiscoveryConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , http_(std::make_unique<QNetworkAccessManager>())
    , neighbors_(std::make_unique<NeighborLookup>(config_.neighbor_program, config_.neighbor_timeout))
{
    // Devices live on the local segment; never route probes through a proxy.
    http_->setProxy(QNetworkProxy::NoProxy);
}

NetworkHostProbe::~NetworkHostProbe() {
    // Tasks use http_ and neighbors_, so they go first.
    const auto tasks = children();
    qDeleteAll(tasks);
}

void NetworkHostProbe::probe_address(const QHostAddress& address, ProbeCallbacks callbacks) {
    start_task(address, QString{}, config_.reachability_enabled, std::move(callbacks));
}

void NetworkHostProbe::probe_hostname(const QString& hostname, ProbeCallbacks callbacks) {
    // Whichever of the lookup and the resolve timer comes first reports.
    auto settled = std::make_shared<bool>(false);

    const int lookup_id = QHostInfo::lookupHost(hostname, this,
                          [this, hostname, callbacks, settled](const QHostInfo& info) {
        if (*settled) return;
        *settled = true;
        if (info.error() != QHostInfo::NoError) {
            qCDebug(lcDiscovery) << "Cannot resolve" << hostname << info.errorString();
            if (callbacks.finished) callbacks.finished(std::nullopt);
            return;
        }
        for (const auto& address : info.addresses()) {
            if (address.protocol() == QAbstractSocket::IPv4Protocol) {
                start_task(address, hostname, false, callbacks);
                return;
            }
        }
        qCDebug(lcDiscovery) << "No IPv4 address for" << hostname;
        if (callbacks.finished) callbacks.finished(std::nullopt);
    });

    QTimer::singleShot(config_.resolve_timeout, this, [hostname, lookup_id, settled,
                                                       finished = std::move(callbacks.finished)]() {
        if (*settled) return;
        *settled = true;
        QHostInfo::abortHostLookup(lookup_id);
        qCDebug(lcDiscovery) << "Resolving" << hostname << "timed out";
        if (finished) finished(std::nullopt);
    });
}

void NetworkHostProbe::start_task(const QHostAddress& address, const QString& hostname,
                                  bool check_reachability, ProbeCallbacks callbacks) {
    auto* task = new ProbeTask(*this, address, hostname, std::move(callbacks));
    task->start(check_reachability);
}

} // namespace voxlink::network
