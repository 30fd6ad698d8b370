#pragma once

#include "core/config.hpp"

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <functional>

namespace voxlink::network {

/**
 * True for six hex byte pairs separated by ':' or '-'.
 */
[[nodiscard]] bool is_hardware_address(const QString& token);

/**
 * Extract the hardware address for `address` from neighbor-tool output.
 *
 * Handles both layouts seen in the wild:
 *   Windows:      "  192.168.1.20   b8-27-eb-12-34-56   dynamic"
 *   Linux/BSD:    "? (192.168.1.20) at b8:27:eb:12:34:56 [ether] on wlan0"
 *
 * Only lines mentioning the address are considered. The result is
 * uppercased with the original separators; empty when nothing matches.
 */
[[nodiscard]] QString parse_hardware_address(const QString& output, const QHostAddress& address);

/**
 * NeighborLookup - Runs the OS neighbor tool ("arp -a <address>") and
 * reports the parsed hardware address.
 *
 * The callback always fires exactly once, with an empty string when the
 * tool is missing, times out, or reports nothing for the address.
 */
class NeighborLookup : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(QString)>;

    NeighborLookup(QString program, Millis timeout, QObject* parent = nullptr);

    void lookup(const QHostAddress& address, Callback done);

private:
    QString program_;
    Millis timeout_;
};

} // namespace voxlink::network
