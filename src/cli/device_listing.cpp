#include "cli/device_listing.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace voxlink::cli {

namespace {

[[nodiscard]] QJsonObject device_to_json(const network::Device& device) {
    QJsonObject obj{
        {QStringLiteral("name"), device.display_name()},
        {QStringLiteral("address"), device.address.toString()},
        {QStringLiteral("port"), static_cast<int>(device.port)},
        {QStringLiteral("lastSeen"), device.last_seen.to_iso_string()},
    };
    if (!device.hostname.isEmpty()) {
        obj.insert(QStringLiteral("hostname"), device.hostname);
    }
    if (!device.hardware_address.isEmpty()) {
        obj.insert(QStringLiteral("mac"), device.hardware_address);
    }
    if (device.capabilities) {
        const auto& caps = *device.capabilities;
        obj.insert(QStringLiteral("capabilities"), QJsonObject{
            {QStringLiteral("name"), caps.name},
            {QStringLiteral("version"), caps.version},
            {QStringLiteral("model"), caps.model},
            {QStringLiteral("serial"), caps.serial},
        });
    }
    return obj;
}

} // namespace

QString format_device_line(const network::Device& device) {
    QStringList parts;
    parts << device.display_name() << device.key();
    if (!device.hardware_address.isEmpty()) {
        parts << device.hardware_address;
    }
    if (device.capabilities) {
        const auto model = QStringLiteral("%1 %2")
            .arg(device.capabilities->model, device.capabilities->version).trimmed();
        if (!model.isEmpty()) {
            parts << model;
        }
    }
    return parts.join(QStringLiteral("  "));
}

QString format_device_list(const std::vector<network::Device>& devices) {
    if (devices.empty()) {
        return QStringLiteral("No devices found.\n");
    }
    QString out;
    for (const auto& device : devices) {
        out += QStringLiteral("- ") + format_device_line(device) + QLatin1Char('\n');
    }
    return out;
}

QString format_device_list_json(const std::vector<network::Device>& devices) {
    QJsonArray list;
    for (const auto& device : devices) {
        list.append(device_to_json(device));
    }
    QJsonObject root{{QStringLiteral("devices"), list}};
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_recognition_line(const protocol::RecognitionResult& result) {
    const auto who = result.speaker_name.isEmpty() ? result.speaker_id : result.speaker_name;
    return QStringLiteral("%1 (%2%) at %3")
        .arg(who.isEmpty() ? QStringLiteral("unknown speaker") : who)
        .arg(result.confidence, 0, 'f', 1)
        .arg(result.timestamp.is_null() ? QStringLiteral("-") : result.timestamp.to_iso_string());
}

} // namespace voxlink::cli
