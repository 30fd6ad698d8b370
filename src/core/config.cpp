#include "core/config.hpp"
#include "core/logging.hpp"

#include <QSettings>
#include <QVariant>

namespace voxlink {
namespace {

// Reads an integer key within [min, max]; anything else keeps `fallback`.
int read_int(QSettings& settings, const char* key, int fallback, int min, int max) {
    const auto name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(name).toInt(&ok);
    if (!ok || value < min || value > max) {
        qCWarning(lcConfig) << "Ignoring invalid value for" << settings.group() + QLatin1Char('/') + name
                            << settings.value(name);
        return fallback;
    }
    return value;
}

Millis read_millis(QSettings& settings, const char* key, Millis fallback) {
    return Millis(read_int(settings, key, static_cast<int>(fallback.count()), 1, 24 * 60 * 60 * 1000));
}

bool read_bool(QSettings& settings, const char* key, bool fallback) {
    const auto name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    return settings.value(name).toBool();
}

QString read_string(QSettings& settings, const char* key, const QString& fallback) {
    const auto name = QString::fromLatin1(key);
    const auto value = settings.value(name).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

QString normalize_path(QString path) {
    if (!path.startsWith(QLatin1Char('/'))) {
        path.prepend(QLatin1Char('/'));
    }
    return path;
}

} // namespace

DiscoveryConfig load_discovery_config(QSettings& settings) {
    DiscoveryConfig cfg;
    settings.beginGroup(QStringLiteral("discovery"));

    cfg.service_port = static_cast<uint16_t>(
        read_int(settings, "service_port", cfg.service_port, 1, 65535));
    cfg.status_path = normalize_path(read_string(settings, "status_path", cfg.status_path));
    cfg.reachability_enabled = read_bool(settings, "reachability_enabled", cfg.reachability_enabled);
    cfg.ping_program = read_string(settings, "ping_program", cfg.ping_program);
    cfg.reachability_timeout = read_millis(settings, "reachability_timeout_ms", cfg.reachability_timeout);
    cfg.resolve_timeout = read_millis(settings, "resolve_timeout_ms", cfg.resolve_timeout);
    cfg.handshake_timeout = read_millis(settings, "handshake_timeout_ms", cfg.handshake_timeout);
    cfg.capability_timeout = read_millis(settings, "capability_timeout_ms", cfg.capability_timeout);
    cfg.neighbor_program = read_string(settings, "neighbor_program", cfg.neighbor_program);
    cfg.neighbor_timeout = read_millis(settings, "neighbor_timeout_ms", cfg.neighbor_timeout);
    cfg.batch_size = read_int(settings, "batch_size", cfg.batch_size, 1, 254);

    if (settings.contains(QStringLiteral("hostnames"))) {
        QStringList hostnames;
        for (const auto& h : settings.value(QStringLiteral("hostnames")).toStringList()) {
            const auto trimmed = h.trimmed();
            if (!trimmed.isEmpty()) {
                hostnames << trimmed;
            }
        }
        cfg.well_known_hostnames = hostnames;
    }

    settings.endGroup();
    return cfg;
}

ConnectionConfig load_connection_config(QSettings& settings) {
    ConnectionConfig cfg;
    settings.beginGroup(QStringLiteral("connection"));

    cfg.stream_path = normalize_path(read_string(settings, "stream_path", cfg.stream_path));
    cfg.connect_timeout = read_millis(settings, "connect_timeout_ms", cfg.connect_timeout);
    cfg.heartbeat_interval = read_millis(settings, "heartbeat_interval_ms", cfg.heartbeat_interval);
    cfg.heartbeat_dead_multiplier =
        read_int(settings, "heartbeat_dead_multiplier", cfg.heartbeat_dead_multiplier, 1, 100);
    cfg.max_reconnect_attempts =
        read_int(settings, "max_reconnect_attempts", cfg.max_reconnect_attempts, 0, 1000);
    cfg.reconnect_delay = read_millis(settings, "reconnect_delay_ms", cfg.reconnect_delay);
    cfg.backoff_cap = read_millis(settings, "backoff_cap_ms", cfg.backoff_cap);

    const auto backoff = settings.value(QStringLiteral("reconnect_backoff")).toString().trimmed().toLower();
    if (backoff == QStringLiteral("exponential")) {
        cfg.reconnect_backoff = BackoffMode::Exponential;
    } else if (!backoff.isEmpty() && backoff != QStringLiteral("fixed")) {
        qCWarning(lcConfig) << "Unknown reconnect_backoff" << backoff << "- using fixed";
    }

    settings.endGroup();
    return cfg;
}

QString backoff_mode_name(BackoffMode mode) {
    switch (mode) {
        case BackoffMode::Fixed: return QStringLiteral("fixed");
        case BackoffMode::Exponential: return QStringLiteral("exponential");
    }
    return QStringLiteral("fixed");
}

} // namespace voxlink
