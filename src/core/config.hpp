#pragma once

#include <QString>
#include <QStringList>
#include <chrono>
#include <cstdint>

class QSettings;

namespace voxlink {

using Millis = std::chrono::milliseconds;

/**
 * DiscoveryConfig - Tunables for the discovery engine and host probes.
 */
struct DiscoveryConfig {
    uint16_t service_port = 8000;
    QString status_path = QStringLiteral("/system/info");

    // Step (a). Disable on hosts where ICMP is filtered.
    bool reachability_enabled = true;
    QString ping_program = QStringLiteral("ping");
    Millis reachability_timeout{1000};

    Millis resolve_timeout{3000};
    Millis handshake_timeout{3000};
    Millis capability_timeout{5000};

    QString neighbor_program = QStringLiteral("arp");
    Millis neighbor_timeout{2000};

    // Maximum probes in flight per subnet.
    int batch_size = 50;

    QStringList well_known_hostnames{
        QStringLiteral("raspberrypi.local"),
        QStringLiteral("raspberrypi"),
        QStringLiteral("voicerecog.local"),
        QStringLiteral("voice-pi.local"),
        QStringLiteral("pi.local"),
    };
};

enum class BackoffMode {
    Fixed,
    Exponential
};

/**
 * ConnectionConfig - Tunables for the connection manager.
 */
struct ConnectionConfig {
    QString stream_path = QStringLiteral("/ws/audio");
    Millis connect_timeout{30000};

    Millis heartbeat_interval{30000};
    // The peer is considered dead after heartbeat_interval * multiplier of silence.
    int heartbeat_dead_multiplier = 4;

    int max_reconnect_attempts = 10;
    Millis reconnect_delay{5000};
    BackoffMode reconnect_backoff = BackoffMode::Fixed;
    Millis backoff_cap{30000};

    [[nodiscard]] Millis heartbeat_dead_threshold() const {
        return heartbeat_interval * heartbeat_dead_multiplier;
    }
};

/**
 * Read the [discovery] group. Missing keys keep their defaults; invalid
 * values are logged and ignored.
 */
DiscoveryConfig load_discovery_config(QSettings& settings);

/**
 * Read the [connection] group.
 */
ConnectionConfig load_connection_config(QSettings& settings);

[[nodiscard]] QString backoff_mode_name(BackoffMode mode);

} // namespace voxlink
