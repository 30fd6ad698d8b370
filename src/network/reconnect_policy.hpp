#pragma once

#include "core/config.hpp"

#include <functional>

namespace voxlink::network {

/**
 * ReconnectPolicy - Delay before each reconnect attempt.
 *
 * Fixed: the same `reconnect_delay` before every attempt.
 * Exponential: starts at `reconnect_delay`, doubles after each attempt with
 * up to one second of random jitter added, capped at `backoff_cap`.
 */
class ReconnectPolicy {
public:
    // Returns a jitter value in [0, bound]. Replaceable in tests.
    using JitterSource = std::function<Millis(Millis bound)>;

    explicit ReconnectPolicy(const ConnectionConfig& config);
    ReconnectPolicy(const ConnectionConfig& config, JitterSource jitter);

    /**
     * Delay to wait before the next attempt; advances the policy.
     */
    Millis next_delay();

    /**
     * Back to the initial delay. Called after a successful connect.
     */
    void reset();

    [[nodiscard]] BackoffMode mode() const { return mode_; }

private:
    BackoffMode mode_;
    Millis initial_;
    Millis cap_;
    Millis current_;
    JitterSource jitter_;
};

} // namespace voxlink::network
