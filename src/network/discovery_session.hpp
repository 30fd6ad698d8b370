#pragma once

#include "network/device.hpp"

#include <QHash>
#include <QMutex>
#include <vector>

namespace voxlink::network {

/**
 * DiscoverySession - Results of one discovery run.
 *
 * Devices are keyed by "address:port". All access goes through one mutex,
 * so probes may report from any thread. Callers emit events after the
 * call returns, never while the lock is held.
 */
class DiscoverySession {
public:
    enum class Upsert {
        Added,
        Replaced
    };

    /**
     * Insert a device, or replace the entry with the same key. A
     * replacement keeps the old hostname, hardware address and
     * capabilities where the new record has none. Returns the stored
     * record through `stored`.
     */
    Upsert upsert(const Device& device, Device* stored = nullptr);

    [[nodiscard]] std::vector<Device> devices() const;
    [[nodiscard]] size_t size() const;

    /**
     * Register outstanding work units (subnet scans, hostname probes).
     */
    void add_pending(int count);

    /**
     * Mark one unit done. Returns true exactly once: for the call that
     * brings the outstanding count to zero.
     */
    bool finish_unit();

    /**
     * Flip the session to completed. True the first time only.
     */
    bool mark_completed();

    [[nodiscard]] bool is_completed() const;

private:
    mutable QMutex mu_;
    std::vector<Device> devices_;
    QHash<QString, size_t> index_;
    int pending_ = 0;
    bool completed_ = false;
};

} // namespace voxlink::network
