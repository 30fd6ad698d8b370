#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace voxlink::network {

/**
 * SystemStatus - Live metrics block of the capability payload.
 */
struct SystemStatus {
    double cpu_usage = 0.0;
    double memory_usage = 0.0;
    double temperature = 0.0;
    double disk_usage = 0.0;
    double uptime_seconds = 0.0;
    bool is_recording = false;
    int active_connections = 0;
};

/**
 * AudioCapabilities - What the device can capture.
 */
struct AudioCapabilities {
    QStringList supported_formats;
    std::vector<int> supported_sample_rates;
    int max_channels = 0;
    QString audio_device;
    bool has_microphone = false;
};

/**
 * DeviceCapabilities - Body of GET /system/info.
 */
struct DeviceCapabilities {
    QString name;
    QString version;
    QString model;
    QString serial;
    SystemStatus status;
    AudioCapabilities audio;
};

/**
 * Device - One host confirmed to run the service.
 *
 * Only built after a successful handshake. Treated as an immutable value:
 * a later probe yields a new Device which replaces the old one by key().
 */
struct Device {
    QHostAddress address;
    QString hostname;
    uint16_t port = 0;
    QString hardware_address;
    std::optional<DeviceCapabilities> capabilities;
    Timestamp last_seen;

    /**
     * Remote-reported name, else hostname, else "device@<address>".
     */
    [[nodiscard]] QString display_name() const;

    /**
     * Identity used for deduplication: "<address>:<port>".
     */
    [[nodiscard]] QString key() const;

    [[nodiscard]] bool has_capabilities() const { return capabilities.has_value(); }

    bool operator==(const Device& other) const {
        return address == other.address && port == other.port;
    }
};

[[nodiscard]] QString device_key(const QHostAddress& address, uint16_t port);

/**
 * Decode a /system/info response body.
 *
 * Keys are read in snake_case, with PascalCase accepted as a fallback.
 * Any present field with the wrong JSON type fails the whole decode: the
 * caller then treats capabilities as unavailable.
 */
[[nodiscard]] Result<DeviceCapabilities> decode_capabilities(const QByteArray& body);

} // namespace voxlink::network

Q_DECLARE_METATYPE(voxlink::network::Device)
