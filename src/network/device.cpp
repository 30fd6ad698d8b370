#include "network/device.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace voxlink::network {
namespace {

// Looks up `snake` first, then `pascal`. Undefined when neither is present.
QJsonValue field(const QJsonObject& obj, const char* snake, const char* pascal) {
    auto v = obj.value(QLatin1String(snake));
    if (v.isUndefined()) {
        v = obj.value(QLatin1String(pascal));
    }
    return v;
}

Error malformed(const char* key) {
    return Error{std::string("capability field '") + key + "' is malformed", ErrorKind::Decode};
}

class Reader {
public:
    explicit Reader(const QJsonObject& obj) : obj_(obj) {}

    void string(const char* snake, const char* pascal, QString& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isString()) { fail(snake); return; }
        out = v.toString();
    }

    void number(const char* snake, const char* pascal, double& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isDouble()) { fail(snake); return; }
        out = v.toDouble();
    }

    void integer(const char* snake, const char* pascal, int& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isDouble()) { fail(snake); return; }
        out = v.toInt();
    }

    void boolean(const char* snake, const char* pascal, bool& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isBool()) { fail(snake); return; }
        out = v.toBool();
    }

    // Uptime arrives either as seconds or as a "[d.]hh:mm:ss" span string.
    void duration(const char* snake, const char* pascal, double& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (v.isDouble()) {
            out = v.toDouble();
            return;
        }
        if (!v.isString()) { fail(snake); return; }
        auto parsed = parse_span(v.toString());
        if (!parsed) { fail(snake); return; }
        out = *parsed;
    }

    void string_list(const char* snake, const char* pascal, QStringList& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isArray()) { fail(snake); return; }
        for (const auto& item : v.toArray()) {
            if (!item.isString()) { fail(snake); return; }
            out << item.toString();
        }
    }

    void int_list(const char* snake, const char* pascal, std::vector<int>& out) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return;
        if (!v.isArray()) { fail(snake); return; }
        for (const auto& item : v.toArray()) {
            if (!item.isDouble()) { fail(snake); return; }
            out.push_back(item.toInt());
        }
    }

    std::optional<QJsonObject> object(const char* snake, const char* pascal) {
        const auto v = field(obj_, snake, pascal);
        if (absent(v)) return std::nullopt;
        if (!v.isObject()) { fail(snake); return std::nullopt; }
        return v.toObject();
    }

    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    static bool absent(const QJsonValue& v) { return v.isUndefined() || v.isNull(); }

    static std::optional<double> parse_span(const QString& text) {
        QString rest = text.trimmed();
        double days = 0;
        const auto parts = rest.split(QLatin1Char(':'));
        if (parts.size() != 3) return std::nullopt;
        QString hours = parts[0];
        const int dot = hours.indexOf(QLatin1Char('.'));
        if (dot >= 0) {
            bool ok = false;
            days = hours.left(dot).toDouble(&ok);
            if (!ok) return std::nullopt;
            hours = hours.mid(dot + 1);
        }
        bool okH = false, okM = false, okS = false;
        const double h = hours.toDouble(&okH);
        const double m = parts[1].toDouble(&okM);
        const double s = parts[2].toDouble(&okS);
        if (!okH || !okM || !okS) return std::nullopt;
        return ((days * 24 + h) * 60 + m) * 60 + s;
    }

    void fail(const char* key) {
        if (!error_) error_ = malformed(key);
    }

    QJsonObject obj_;
    std::optional<Error> error_;
};

} // namespace

QString Device::display_name() const {
    if (capabilities && !capabilities->name.trimmed().isEmpty()) {
        return capabilities->name.trimmed();
    }
    if (!hostname.isEmpty()) {
        return hostname;
    }
    return QStringLiteral("device@%1").arg(address.toString());
}

QString Device::key() const {
    return device_key(address, port);
}

QString device_key(const QHostAddress& address, uint16_t port) {
    return QStringLiteral("%1:%2").arg(address.toString()).arg(port);
}

Result<DeviceCapabilities> decode_capabilities(const QByteArray& body) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<DeviceCapabilities>::err(Error{"capability body is not a JSON object",
                                                     ErrorKind::Decode});
    }

    DeviceCapabilities caps;
    Reader top(doc.object());
    top.string("name", "Name", caps.name);
    top.string("version", "Version", caps.version);
    top.string("model", "Model", caps.model);
    top.string("serial_number", "SerialNumber", caps.serial);
    if (caps.serial.isEmpty()) {
        top.string("serial", "Serial", caps.serial);
    }

    if (auto status = top.object("status", "Status")) {
        Reader r(*status);
        r.number("cpu_usage", "CpuUsage", caps.status.cpu_usage);
        r.number("memory_usage", "MemoryUsage", caps.status.memory_usage);
        r.number("temperature", "Temperature", caps.status.temperature);
        r.number("disk_usage", "DiskUsage", caps.status.disk_usage);
        r.duration("uptime", "Uptime", caps.status.uptime_seconds);
        r.boolean("is_recording", "IsRecording", caps.status.is_recording);
        r.integer("active_connections", "ActiveConnections", caps.status.active_connections);
        if (r.error()) return Result<DeviceCapabilities>::err(*r.error());
    }

    if (auto audio = top.object("audio", "Audio")) {
        Reader r(*audio);
        r.string_list("supported_formats", "SupportedFormats", caps.audio.supported_formats);
        r.int_list("supported_sample_rates", "SupportedSampleRates", caps.audio.supported_sample_rates);
        r.integer("max_channels", "MaxChannels", caps.audio.max_channels);
        r.string("audio_device", "AudioDevice", caps.audio.audio_device);
        r.boolean("has_microphone", "HasMicrophone", caps.audio.has_microphone);
        if (r.error()) return Result<DeviceCapabilities>::err(*r.error());
    }

    if (top.error()) {
        return Result<DeviceCapabilities>::err(*top.error());
    }
    return Result<DeviceCapabilities>::ok(std::move(caps));
}

} // namespace voxlink::network
