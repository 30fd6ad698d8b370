#include "network/reconnect_policy.hpp"

#include <QRandomGenerator>

#include <algorithm>

namespace voxlink::network {

namespace {

constexpr Millis kMaxJitter{1000};

Millis random_jitter(Millis bound) {
    if (bound.count() <= 0) {
        return Millis(0);
    }
    return Millis(QRandomGenerator::global()->bounded(static_cast<qint64>(bound.count()) + 1));
}

} // namespace

ReconnectPolicy::ReconnectPolicy(const ConnectionConfig& config)
    : ReconnectPolicy(config, random_jitter)
{
}

ReconnectPolicy::ReconnectPolicy(const ConnectionConfig& config, JitterSource jitter)
    : mode_(config.reconnect_backoff)
    , initial_(std::max(Millis(0), config.reconnect_delay))
    , cap_(std::max(config.backoff_cap, config.reconnect_delay))
    , current_(initial_)
    , jitter_(jitter ? std::move(jitter) : JitterSource(random_jitter))
{
}

Millis ReconnectPolicy::next_delay() {
    if (mode_ == BackoffMode::Fixed) {
        return initial_;
    }

    const Millis delay = std::min(current_, cap_);
    current_ = std::min(current_ * 2 + jitter_(kMaxJitter), cap_);
    return delay;
}

void ReconnectPolicy::reset() {
    current_ = initial_;
}

} // namespace voxlink::network
