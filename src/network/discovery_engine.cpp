#include "network/discovery_engine.hpp"
#include "network/discovery_session.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QMetaObject>
#include <QPointer>

#include <algorithm>
#include <exception>

namespace voxlink::network {

DiscoveryEngine::DiscoveryEngine(std::unique_ptr<AddressSpaceEnumerator> address_space,
                                 std::unique_ptr<HostProbe> probe,
                                 DiscoveryConfig config,
                                 QObject* parent)
    : QObject(parent)
    , address_space_(std::move(address_space))
    , probe_(std::move(probe))
    , config_(std::move(config))
{
    qRegisterMetaType<voxlink::network::Device>();
    qRegisterMetaType<std::vector<voxlink::network::Device>>();
}

DiscoveryEngine::~DiscoveryEngine() {
    // Drop the probe first so no callback reaches a half-destroyed engine.
    probe_.reset();
}

std::vector<Device> DiscoveryEngine::discover() {
    if (!startDiscovery()) {
        return {};
    }

    if (discovering_) {
        QEventLoop loop;
        connect(this, &DiscoveryEngine::discoveringChanged, &loop, [this, &loop]() {
            if (!discovering_) {
                loop.quit();
            }
        });
        loop.exec();
    }
    return last_devices_;
}

bool DiscoveryEngine::startDiscovery() {
    if (discovering_) {
        qCWarning(lcDiscovery) << "Discovery already in progress";
        return false;
    }

    std::vector<Subnet> subnets;
    QStringList hostnames;
    try {
        auto enumerated = address_space_->subnets();
        if (enumerated.is_err()) {
            const auto message = QString::fromStdString(enumerated.unwrap_err().message);
            qCCritical(lcDiscovery) << "Error during device discovery:" << message;
            emit discoveryFailed(message);
            return false;
        }
        subnets = std::move(enumerated).unwrap();
        hostnames = address_space_->well_known_hostnames();
    } catch (const std::exception& e) {
        const auto message = QString::fromUtf8(e.what());
        qCCritical(lcDiscovery) << "Error during device discovery:" << message;
        emit discoveryFailed(message);
        return false;
    }

    auto session = std::make_shared<DiscoverySession>();
    session_ = session;
    discovering_ = true;
    emit discoveringChanged();

    qCInfo(lcDiscovery) << "Starting device discovery over" << subnets.size() << "subnet(s) and"
                        << hostnames.size() << "hostname(s)";

    const int units = static_cast<int>(subnets.size()) + static_cast<int>(hostnames.size());
    if (units == 0) {
        completeSession(session);
        return true;
    }
    session->add_pending(units);

    for (const auto& subnet : subnets) {
        auto scan = std::make_shared<SubnetScan>();
        scan->subnet = subnet;
        scan->candidates = subnet.host_candidates();
        qCDebug(lcDiscovery) << "Scanning subnet" << subnet.to_cidr();
        launchBatch(scan, session);
    }

    // Few of these, so no batching.
    for (const auto& hostname : hostnames) {
        probe_->probe_hostname(hostname, sessionCallbacks(session, [this, session]() {
            finishUnit(session);
        }));
    }

    return true;
}

std::optional<Device> DiscoveryEngine::findDevice(const QString& hostname) {
    const auto name = hostname.trimmed();
    if (name.isEmpty()) {
        qCDebug(lcDiscovery) << "findDevice called with an empty hostname";
        return std::nullopt;
    }

    qCInfo(lcDiscovery) << "Looking for device:" << name;

    std::optional<Device> found;
    bool done = false;
    QEventLoop loop;

    ProbeCallbacks callbacks;
    callbacks.finished = [&found, &done, &loop](std::optional<Device> device) {
        found = std::move(device);
        done = true;
        loop.quit();
    };
    probe_->probe_hostname(name, std::move(callbacks));

    if (!done) {
        loop.exec();
    }

    if (found) {
        qCInfo(lcDiscovery) << "Found device:" << found->display_name() << "at" << found->key();
    } else {
        qCDebug(lcDiscovery) << "Device not found:" << name;
    }
    return found;
}

ProbeCallbacks DiscoveryEngine::sessionCallbacks(const std::shared_ptr<DiscoverySession>& session,
                                                 std::function<void()> on_finished) {
    QPointer<DiscoveryEngine> self(this);
    ProbeCallbacks callbacks;

    // AutoConnection: direct on our thread, queued from any other.
    callbacks.handshake = [self, session](const Device& device) {
        if (!self) return;
        QMetaObject::invokeMethod(self.data(), [self, session, device]() {
            if (self) self->recordDevice(session, device);
        });
    };
    callbacks.finished = [self, session, on_finished = std::move(on_finished)](std::optional<Device> device) {
        if (!self) return;
        QMetaObject::invokeMethod(self.data(), [self, session, device = std::move(device), on_finished]() {
            if (!self) return;
            if (device) {
                self->recordDevice(session, *device);
            }
            on_finished();
        });
    };
    return callbacks;
}

void DiscoveryEngine::launchBatch(const std::shared_ptr<SubnetScan>& scan,
                                  const std::shared_ptr<DiscoverySession>& session) {
    if (scan->next >= scan->candidates.size()) {
        qCDebug(lcDiscovery) << "Finished scanning subnet" << scan->subnet.to_cidr();
        finishUnit(session);
        return;
    }

    const size_t batch_size = static_cast<size_t>(std::max(1, config_.batch_size));
    const size_t begin = scan->next;
    const size_t end = std::min(begin + batch_size, scan->candidates.size());
    scan->next = end;
    // Set before launching: a probe may complete synchronously.
    scan->in_flight = end - begin;

    for (size_t i = begin; i < end; ++i) {
        probe_->probe_address(scan->candidates[i], sessionCallbacks(session, [this, scan, session]() {
            if (--scan->in_flight == 0) {
                launchBatch(scan, session);
            }
        }));
    }
}

void DiscoveryEngine::recordDevice(const std::shared_ptr<DiscoverySession>& session,
                                   const Device& device) {
    if (session->is_completed()) {
        return;
    }

    Device stored;
    const auto outcome = session->upsert(device, &stored);
    if (outcome == DiscoverySession::Upsert::Added) {
        qCInfo(lcDiscovery) << "Discovered device:" << stored.display_name() << "at" << stored.key();
        emit deviceDiscovered(stored);
    } else {
        qCDebug(lcDiscovery) << "Updated device:" << stored.display_name() << "at" << stored.key();
        emit deviceUpdated(stored);
    }
}

void DiscoveryEngine::finishUnit(const std::shared_ptr<DiscoverySession>& session) {
    if (session->finish_unit()) {
        completeSession(session);
    }
}

void DiscoveryEngine::completeSession(const std::shared_ptr<DiscoverySession>& session) {
    if (!session->mark_completed()) {
        return;
    }

    last_devices_ = session->devices();
    if (session_ == session) {
        session_.reset();
    }
    discovering_ = false;

    qCInfo(lcDiscovery) << "Discovery completed, found" << last_devices_.size() << "device(s)";
    emit discoveryCompleted(last_devices_);
    emit discoveringChanged();
}

} // namespace voxlink::network
