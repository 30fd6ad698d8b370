#include "network/discovery_session.hpp"

namespace voxlink::network {

DiscoverySession::Upsert DiscoverySession::upsert(const Device& device, Device* stored) {
    QMutexLocker lock(&mu_);

    const auto key = device.key();
    auto it = index_.constFind(key);
    if (it == index_.constEnd()) {
        index_.insert(key, devices_.size());
        devices_.push_back(device);
        if (stored) *stored = device;
        return Upsert::Added;
    }

    const Device& previous = devices_[it.value()];
    Device merged = device;
    if (merged.hostname.isEmpty()) merged.hostname = previous.hostname;
    if (merged.hardware_address.isEmpty()) merged.hardware_address = previous.hardware_address;
    if (!merged.capabilities) merged.capabilities = previous.capabilities;
    if (merged.last_seen < previous.last_seen) merged.last_seen = previous.last_seen;

    devices_[it.value()] = merged;
    if (stored) *stored = merged;
    return Upsert::Replaced;
}

std::vector<Device> DiscoverySession::devices() const {
    QMutexLocker lock(&mu_);
    return devices_;
}

size_t DiscoverySession::size() const {
    QMutexLocker lock(&mu_);
    return devices_.size();
}

void DiscoverySession::add_pending(int count) {
    QMutexLocker lock(&mu_);
    pending_ += count;
}

bool DiscoverySession::finish_unit() {
    QMutexLocker lock(&mu_);
    if (pending_ <= 0) {
        return false;
    }
    --pending_;
    return pending_ == 0;
}

bool DiscoverySession::mark_completed() {
    QMutexLocker lock(&mu_);
    if (completed_) {
        return false;
    }
    completed_ = true;
    return true;
}

bool DiscoverySession::is_completed() const {
    QMutexLocker lock(&mu_);
    return completed_;
}

} // namespace voxlink::network
