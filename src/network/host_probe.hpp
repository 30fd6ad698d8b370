#pragma once

#include "core/config.hpp"
#include "network/device.hpp"

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>
#include <optional>

class QNetworkAccessManager;

namespace voxlink::network {

class NeighborLookup;

/**
 * ProbeCallbacks - How a probe reports back.
 *
 * `handshake` fires once the service port accepted a connection, with a
 * Device that has no capabilities or hardware address yet. `finished`
 * always fires exactly once, last: with the enriched Device, or nullopt
 * when the host is not a target. A probe that never reaches the handshake
 * only calls `finished`.
 */
struct ProbeCallbacks {
    std::function<void(const Device&)> handshake;
    std::function<void(std::optional<Device>)> finished;
};

/**
 * HostProbe - Decides whether one address or hostname runs the service.
 *
 * Implementations never throw and never block; every step is bounded by
 * its own timeout.
 */
class HostProbe {
public:
    virtual ~HostProbe() = default;

    virtual void probe_address(const QHostAddress& address, ProbeCallbacks callbacks) = 0;

    /**
     * Resolve the hostname to an IPv4 address, then run the handshake,
     * capability and hardware-address steps. DNS failure means nullopt.
     */
    virtual void probe_hostname(const QString& hostname, ProbeCallbacks callbacks) = 0;
};

/**
 * NetworkHostProbe - HostProbe over real sockets.
 *
 * Steps, short-circuiting on the first hard failure:
 *   a. ping (one echo request); skipped for hostname probes
 *   b. TCP connect to the service port
 *   c. GET <status_path>, decoded into capabilities (best effort)
 *   d. neighbor-table lookup for the hardware address (best effort)
 */
class NetworkHostProbe final : public QObject, public HostProbe {
    Q_OBJECT

public:
    explicit NetworkHostProbe(DiscoveryConfig config, QObject* parent = nullptr);
    ~NetworkHostProbe() override;

    void probe_address(const QHostAddress& address, ProbeCallbacks callbacks) override;
    void probe_hostname(const QString& hostname, ProbeCallbacks callbacks) override;

private:
    friend class ProbeTask;

    DiscoveryConfig config_;
    std::unique_ptr<QNetworkAccessManager> http_;
    std::unique_ptr<NeighborLookup> neighbors_;

    void start_task(const QHostAddress& address, const QString& hostname,
                    bool check_reachability, ProbeCallbacks callbacks);
};

} // namespace voxlink::network
