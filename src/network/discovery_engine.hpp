#pragma once

#include "core/config.hpp"
#include "network/address_space.hpp"
#include "network/device.hpp"
#include "network/host_probe.hpp"

#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

namespace voxlink::network {

class DiscoverySession;

/**
 * DiscoveryEngine - Finds devices on the attached subnets by probing.
 *
 * There is no directory service: every candidate address of every local
 * subnet is probed, plus a short list of well-known hostnames. Probes for
 * one subnet run in batches of `DiscoveryConfig::batch_size`; subnets and
 * hostname probes proceed in parallel.
 *
 * At most one session runs at a time. Results are reported
 * incrementally through deviceDiscovered/deviceUpdated and once, in full,
 * through discoveryCompleted.
 *
 * The engine is used from the thread it lives on; probe callbacks coming
 * from other threads are marshalled onto it.
 */
class DiscoveryEngine : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool discovering READ isDiscovering NOTIFY discoveringChanged)

public:
    DiscoveryEngine(std::unique_ptr<AddressSpaceEnumerator> address_space,
                    std::unique_ptr<HostProbe> probe,
                    DiscoveryConfig config = {},
                    QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    /**
     * Run one session to completion and return the deduplicated devices.
     *
     * Spins a local event loop until discoveryCompleted. Returns an empty
     * list immediately when a session is already running or when subnet
     * enumeration fails.
     */
    std::vector<Device> discover();

    /**
     * Start a session without waiting. False when one is already running
     * or enumeration failed (discoveryFailed is emitted in that case).
     */
    bool startDiscovery();

    /**
     * Probe one hostname outside of any session. Returns nullopt on any
     * failure; never emits session events.
     */
    std::optional<Device> findDevice(const QString& hostname);

    [[nodiscard]] bool isDiscovering() const { return discovering_; }

    /**
     * Devices of the last completed session.
     */
    [[nodiscard]] const std::vector<Device>& lastDevices() const { return last_devices_; }

    [[nodiscard]] const DiscoveryConfig& config() const { return config_; }

signals:
    void deviceDiscovered(const voxlink::network::Device& device);
    void deviceUpdated(const voxlink::network::Device& device);
    void discoveryCompleted(const std::vector<voxlink::network::Device>& devices);
    void discoveryFailed(const QString& message);
    void discoveringChanged();

private:
    struct SubnetScan {
        Subnet subnet;
        std::vector<QHostAddress> candidates;
        size_t next = 0;
        size_t in_flight = 0;
    };

    std::unique_ptr<AddressSpaceEnumerator> address_space_;
    std::unique_ptr<HostProbe> probe_;
    DiscoveryConfig config_;

    std::shared_ptr<DiscoverySession> session_;
    std::vector<Device> last_devices_;
    bool discovering_ = false;

    ProbeCallbacks sessionCallbacks(const std::shared_ptr<DiscoverySession>& session,
                                    std::function<void()> on_finished);
    void launchBatch(const std::shared_ptr<SubnetScan>& scan,
                     const std::shared_ptr<DiscoverySession>& session);
    void recordDevice(const std::shared_ptr<DiscoverySession>& session, const Device& device);
    void finishUnit(const std::shared_ptr<DiscoverySession>& session);
    void completeSession(const std::shared_ptr<DiscoverySession>& session);
};

} // namespace voxlink::network

Q_DECLARE_METATYPE(std::vector<voxlink::network::Device>)
