#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace voxlink::network {

/**
 * Subnet - An IPv4 network in CIDR form.
 */
struct Subnet {
    quint32 network = 0;
    int prefix_length = 0;

    [[nodiscard]] QHostAddress network_address() const { return QHostAddress(network); }

    /**
     * "192.168.1.0/24"
     */
    [[nodiscard]] QString to_cidr() const;

    /**
     * The 254 scan candidates "<a.b.c>.1" .. "<a.b.c>.254" taken from the
     * first three octets of the network address, whatever the prefix.
     * Network and broadcast addresses are not filtered out; probes to them
     * simply fail.
     */
    [[nodiscard]] std::vector<QHostAddress> host_candidates() const;

    bool operator==(const Subnet&) const = default;
};

/**
 * Compute the subnet for an interface address and its netmask:
 * network = address AND mask, prefix = popcount(mask). Returns nullopt
 * for non-IPv4 input.
 */
[[nodiscard]] std::optional<Subnet> subnet_from(const QHostAddress& address,
                                                const QHostAddress& netmask);

/**
 * Parse "10.0.0.0/24". The network address is normalised by the prefix.
 */
[[nodiscard]] std::optional<Subnet> parse_cidr(const QString& text);

/**
 * AddressSpaceEnumerator - Source of probe candidates.
 *
 * subnets() may report failure; the discovery engine treats that as a
 * session-level error.
 */
class AddressSpaceEnumerator {
public:
    virtual ~AddressSpaceEnumerator() = default;

    virtual Result<std::vector<Subnet>> subnets() = 0;
    virtual QStringList well_known_hostnames() const = 0;
};

/**
 * LocalAddressSpace - Subnets of the machine's up, non-loopback interfaces.
 */
class LocalAddressSpace final : public AddressSpaceEnumerator {
public:
    explicit LocalAddressSpace(QStringList hostnames);

    Result<std::vector<Subnet>> subnets() override;
    QStringList well_known_hostnames() const override { return hostnames_; }

private:
    QStringList hostnames_;
};

/**
 * StaticAddressSpace - Fixed subnets, e.g. from the command line.
 */
class StaticAddressSpace final : public AddressSpaceEnumerator {
public:
    StaticAddressSpace(std::vector<Subnet> subnets, QStringList hostnames)
        : subnets_(std::move(subnets)), hostnames_(std::move(hostnames)) {}

    Result<std::vector<Subnet>> subnets() override {
        return Result<std::vector<Subnet>>::ok(subnets_);
    }
    QStringList well_known_hostnames() const override { return hostnames_; }

private:
    std::vector<Subnet> subnets_;
    QStringList hostnames_;
};

} // namespace voxlink::network
