#include "network/address_space.hpp"
#include "core/logging.hpp"

#include <QNetworkInterface>
#include <algorithm>
#include <bit>

namespace voxlink::network {

QString Subnet::to_cidr() const {
    return QStringLiteral("%1/%2").arg(network_address().toString()).arg(prefix_length);
}

std::vector<QHostAddress> Subnet::host_candidates() const {
    std::vector<QHostAddress> hosts;
    hosts.reserve(254);
    const quint32 base = network & 0xFFFFFF00u;
    for (quint32 i = 1; i <= 254; ++i) {
        hosts.emplace_back(base | i);
    }
    return hosts;
}

std::optional<Subnet> subnet_from(const QHostAddress& address, const QHostAddress& netmask) {
    if (address.protocol() != QAbstractSocket::IPv4Protocol ||
        netmask.protocol() != QAbstractSocket::IPv4Protocol) {
        return std::nullopt;
    }

    const quint32 mask = netmask.toIPv4Address();
    Subnet subnet;
    subnet.network = address.toIPv4Address() & mask;
    // Per-byte popcount, same as summing the mask octets' bits.
    subnet.prefix_length = std::popcount(mask);
    return subnet;
}

std::optional<Subnet> parse_cidr(const QString& text) {
    const auto parts = text.trimmed().split(QLatin1Char('/'));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    QHostAddress address;
    if (!address.setAddress(parts[0]) || address.protocol() != QAbstractSocket::IPv4Protocol) {
        return std::nullopt;
    }
    bool ok = false;
    const int prefix = parts[1].toInt(&ok);
    if (!ok || prefix < 0 || prefix > 32) {
        return std::nullopt;
    }
    const quint32 mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    return subnet_from(address, QHostAddress(mask));
}

LocalAddressSpace::LocalAddressSpace(QStringList hostnames)
    : hostnames_(std::move(hostnames))
{
}

Result<std::vector<Subnet>> LocalAddressSpace::subnets() {
    std::vector<Subnet> result;

    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) ||
            !flags.testFlag(QNetworkInterface::IsRunning) ||
            flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }

        for (const auto& entry : iface.addressEntries()) {
            auto subnet = subnet_from(entry.ip(), entry.netmask());
            if (!subnet || subnet->prefix_length == 0) {
                continue;
            }
            if (std::find(result.begin(), result.end(), *subnet) != result.end()) {
                continue;
            }
            qCDebug(lcDiscovery) << "Interface" << iface.humanReadableName()
                                 << "subnet" << subnet->to_cidr();
            result.push_back(*subnet);
        }
    }

    return Result<std::vector<Subnet>>::ok(std::move(result));
}

} // namespace voxlink::network
