#include "cli/arguments.hpp"

namespace voxlink::cli {
namespace {

Error usage_error(const QString& message) {
    return Error(message.toStdString(), ErrorKind::InvalidArgument);
}

Result<qint64> parse_whole_number(const QString& value, const char* what) {
    bool ok = false;
    const qint64 number = value.trimmed().toLongLong(&ok);
    if (!ok || number < 0) {
        return Result<qint64>::err(
            usage_error(QStringLiteral("Invalid %1: %2").arg(QLatin1String(what), value)));
    }
    return Result<qint64>::ok(number);
}

} // namespace

Result<std::vector<network::Subnet>> parse_subnet_options(const QStringList& values) {
    std::vector<network::Subnet> subnets;
    subnets.reserve(static_cast<size_t>(values.size()));
    for (const auto& text : values) {
        auto subnet = network::parse_cidr(text);
        if (!subnet) {
            return Result<std::vector<network::Subnet>>::err(
                usage_error(QStringLiteral("Invalid subnet: %1").arg(text)));
        }
        subnets.push_back(*subnet);
    }
    return Result<std::vector<network::Subnet>>::ok(std::move(subnets));
}

Result<uint16_t> parse_port_option(const QString& value) {
    return parse_whole_number(value, "port")
        .and_then([&value](qint64 port) -> Result<qint64> {
            if (port < 1 || port > 65535) {
                return Result<qint64>::err(usage_error(QStringLiteral("Invalid port: %1").arg(value)));
            }
            return Result<qint64>::ok(port);
        })
        .map([](qint64 port) { return static_cast<uint16_t>(port); });
}

Result<std::chrono::seconds> parse_duration_option(const QString& value) {
    return parse_whole_number(value, "duration")
        .and_then([&value](qint64 seconds) -> Result<std::chrono::seconds> {
            if (seconds > kMaxListenDuration.count()) {
                return Result<std::chrono::seconds>::err(usage_error(
                    QStringLiteral("Duration %1 exceeds the maximum of %2 seconds")
                        .arg(value).arg(kMaxListenDuration.count())));
            }
            return Result<std::chrono::seconds>::ok(std::chrono::seconds(seconds));
        });
}

} // namespace voxlink::cli
