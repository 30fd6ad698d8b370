#include "network/neighbor_table.hpp"
#include "core/logging.hpp"

#include <QProcess>
#include <QRegularExpression>
#include <QTimer>

#include <algorithm>
#include <memory>

namespace voxlink::network {
namespace {

const QRegularExpression& hardware_address_pattern() {
    static const QRegularExpression re(
        QStringLiteral("^([0-9A-Fa-f]{2}[:-]){5}([0-9A-Fa-f]{2})$"));
    return re;
}

QString strip_brackets(QString token) {
    while (token.startsWith(QLatin1Char('(')) || token.startsWith(QLatin1Char('['))) {
        token.remove(0, 1);
    }
    while (token.endsWith(QLatin1Char(')')) || token.endsWith(QLatin1Char(']'))) {
        token.chop(1);
    }
    return token;
}

} // namespace

bool is_hardware_address(const QString& token) {
    return hardware_address_pattern().match(token).hasMatch();
}

QString parse_hardware_address(const QString& output, const QHostAddress& address) {
    const auto needle = address.toString();
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    for (const auto& line : output.split(QLatin1Char('\n'))) {
        const auto tokens = line.split(whitespace, Qt::SkipEmptyParts);
        // Exact token match, so 10.0.0.4 does not pick up 10.0.0.42's entry.
        const bool mentions = std::any_of(tokens.begin(), tokens.end(), [&](const QString& t) {
            return strip_brackets(t) == needle;
        });
        if (!mentions) {
            continue;
        }
        for (const auto& token : tokens) {
            if (is_hardware_address(token)) {
                return token.toUpper();
            }
        }
    }
    return QString{};
}

NeighborLookup::NeighborLookup(QString program, Millis timeout, QObject* parent)
    : QObject(parent)
    , program_(std::move(program))
    , timeout_(timeout)
{
}

void NeighborLookup::lookup(const QHostAddress& address, Callback done) {
    auto* process = new QProcess(this);
    auto* timer = new QTimer(process);
    timer->setSingleShot(true);

    // Shared so whichever of finished/error/timeout comes first reports.
    auto reported = std::make_shared<bool>(false);
    auto report = [process, reported, done = std::move(done)](const QString& mac) {
        if (*reported) return;
        *reported = true;
        process->disconnect();
        if (process->state() != QProcess::NotRunning) {
            process->kill();
        }
        process->deleteLater();
        done(mac);
    };

    connect(process, &QProcess::finished, this, [process, address, report](int, QProcess::ExitStatus) {
        const auto output = QString::fromLocal8Bit(process->readAllStandardOutput());
        report(parse_hardware_address(output, address));
    });
    connect(process, &QProcess::errorOccurred, this, [this, address, report](QProcess::ProcessError err) {
        if (err == QProcess::FailedToStart) {
            qCDebug(lcDiscovery) << "Neighbor tool" << program_ << "unavailable for" << address.toString();
        }
        report(QString{});
    });
    connect(timer, &QTimer::timeout, this, [address, report]() {
        qCDebug(lcDiscovery) << "Neighbor lookup timed out for" << address.toString();
        report(QString{});
    });

    timer->start(timeout_);
    process->start(program_, {QStringLiteral("-a"), address.toString()});
}

} // namespace voxlink::network
