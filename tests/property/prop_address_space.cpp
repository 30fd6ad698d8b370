#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "network/address_space.hpp"

using namespace voxlink::network;

namespace {

QString dotted(quint32 address) {
    return QHostAddress(address).toString();
}

} // namespace

TEST_CASE("Property: scan candidates cover the /24 of the network", "[property][address_space]") {
    rc::check("254 hosts sharing the first three octets, ending .1 to .254",
        [](quint32 address, unsigned int prefix_seed) {
            const int prefix = static_cast<int>(prefix_seed % 33);
            auto subnet = parse_cidr(dotted(address) + QStringLiteral("/%1").arg(prefix));
            RC_ASSERT(subnet.has_value());

            const auto hosts = subnet->host_candidates();
            RC_ASSERT(hosts.size() == 254u);
            const quint32 base = subnet->network & 0xFFFFFF00u;
            for (size_t i = 0; i < hosts.size(); ++i) {
                RC_ASSERT(hosts[i].toIPv4Address() == (base | static_cast<quint32>(i + 1)));
            }
            return true;
        }
    );
}

TEST_CASE("Property: CIDR text round-trips", "[property][address_space]") {
    rc::check("parse_cidr(s.to_cidr()) == s",
        [](quint32 address, unsigned int prefix_seed) {
            const int prefix = static_cast<int>(prefix_seed % 33);
            auto subnet = parse_cidr(dotted(address) + QStringLiteral("/%1").arg(prefix));
            RC_ASSERT(subnet.has_value());
            RC_ASSERT(subnet->prefix_length == prefix);

            auto again = parse_cidr(subnet->to_cidr());
            RC_ASSERT(again.has_value());
            RC_ASSERT(*again == *subnet);
            return true;
        }
    );
}
