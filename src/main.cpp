#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include "cli/arguments.hpp"
#include "cli/device_listing.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/address_space.hpp"
#include "network/connection_manager.hpp"
#include "network/discovery_engine.hpp"
#include "network/host_probe.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace {

std::unique_ptr<QSettings> open_settings(const QString& path) {
    if (!path.isEmpty()) {
        return std::make_unique<QSettings>(path, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>();
}

std::unique_ptr<voxlink::network::DiscoveryEngine> make_engine(const voxlink::DiscoveryConfig& config,
                                                               std::vector<voxlink::network::Subnet> subnets) {
    using namespace voxlink::network;

    std::unique_ptr<AddressSpaceEnumerator> space;
    if (subnets.empty()) {
        space = std::make_unique<LocalAddressSpace>(config.well_known_hostnames);
    } else {
        space = std::make_unique<StaticAddressSpace>(std::move(subnets), config.well_known_hostnames);
    }

    return std::make_unique<DiscoveryEngine>(std::move(space),
                                             std::make_unique<NetworkHostProbe>(config),
                                             config);
}

int usage_error(const voxlink::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << '\n';
    return voxlink::cli::kExitUsage;
}

int run_discover(const voxlink::DiscoveryConfig& config, std::vector<voxlink::network::Subnet> subnets,
                 bool json) {
    auto engine = make_engine(config, std::move(subnets));

    if (!json) {
        QObject::connect(engine.get(), &voxlink::network::DiscoveryEngine::deviceDiscovered,
                         [](const voxlink::network::Device& device) {
            QTextStream(stdout) << "found: " << voxlink::cli::format_device_line(device) << Qt::endl;
        });
    }

    const auto devices = engine->discover();
    QTextStream out(stdout);
    out << (json ? voxlink::cli::format_device_list_json(devices)
                 : voxlink::cli::format_device_list(devices));
    return devices.empty() ? voxlink::cli::kExitFailure : voxlink::cli::kExitOk;
}

int run_find(const voxlink::DiscoveryConfig& config, const QString& hostname, bool json) {
    auto engine = make_engine(config, {});
    const auto device = engine->findDevice(hostname);
    if (!device) {
        QTextStream(stderr) << "Device not found: " << hostname << '\n';
        return voxlink::cli::kExitFailure;
    }
    const std::vector<voxlink::network::Device> devices{*device};
    QTextStream(stdout) << (json ? voxlink::cli::format_device_list_json(devices)
                                 : voxlink::cli::format_device_list(devices));
    return voxlink::cli::kExitOk;
}

int run_listen(QCoreApplication& app, const voxlink::ConnectionConfig& config,
               const QString& host, uint16_t port, std::chrono::seconds duration) {
    using voxlink::network::ConnectionManager;

    ConnectionManager manager(config);
    QTextStream out(stdout);

    QObject::connect(&manager, &ConnectionManager::stateChanged,
                     [&out](ConnectionManager::State from, ConnectionManager::State to) {
        out << "state: " << voxlink::network::state_name(from) << " -> "
            << voxlink::network::state_name(to) << Qt::endl;
    });
    QObject::connect(&manager, &ConnectionManager::recognitionResultReceived,
                     [&out](const voxlink::protocol::RecognitionResult& result) {
        out << "recognized: " << voxlink::cli::format_recognition_line(result) << Qt::endl;
    });
    QObject::connect(&manager, &ConnectionManager::serverError, [&out](const QString& message) {
        out << "server error: " << message << Qt::endl;
    });

    if (!manager.connectToDevice(host, port)) {
        QTextStream(stderr) << "Connection failed: " << manager.lastError() << '\n';
        return voxlink::cli::kExitFailure;
    }

    int exit_code = voxlink::cli::kExitOk;
    QObject::connect(&manager, &ConnectionManager::reconnectFailed, &app, [&app, &exit_code]() {
        exit_code = voxlink::cli::kExitFailure;
        app.quit();
    });
    if (duration.count() > 0) {
        QTimer::singleShot(std::chrono::duration_cast<std::chrono::milliseconds>(duration),
                           &app, &QCoreApplication::quit);
    }

    app.exec();
    manager.disconnect();
    return exit_code;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("voxlink");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("voxlink");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Find voice-recognition devices on the LAN and stream from them"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("Read settings from this ini file (default: VOXLINK_CONFIG or the platform location)."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (discover, find)."));
    parser.addOption(jsonOption);

    const QCommandLineOption subnetOption(
        QStringList{QStringLiteral("subnet")},
        QStringLiteral("Scan this CIDR instead of the local interfaces (repeatable)."),
        QStringLiteral("cidr"));
    parser.addOption(subnetOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Service port for 'listen' (default from settings)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption durationOption(
        QStringList{QStringLiteral("duration")},
        QStringLiteral("Seconds to listen before disconnecting (0 = until the link is lost)."),
        QStringLiteral("seconds"),
        QStringLiteral("0"));
    parser.addOption(durationOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging for all categories."));
    parser.addOption(debugOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("discover | find <hostname> | listen <host>"));
    parser.process(app);

    voxlink::apply_debug_filter_rules(parser.isSet(debugOption));
    if (parser.isSet(logFileOption)) {
        voxlink::install_file_logging(parser.value(logFileOption));
    }

    QString config_path = parser.value(configOption);
    if (config_path.isEmpty()) {
        config_path = qEnvironmentVariable("VOXLINK_CONFIG");
    }
    auto settings = open_settings(config_path);
    const auto discovery_config = voxlink::load_discovery_config(*settings);
    const auto connection_config = voxlink::load_connection_config(*settings);

    const auto positional = parser.positionalArguments();
    const QString command = positional.value(0);

    if (command == QStringLiteral("discover")) {
        auto subnets = voxlink::cli::parse_subnet_options(parser.values(subnetOption));
        if (subnets.is_err()) {
            return usage_error(subnets.unwrap_err());
        }
        return run_discover(discovery_config, std::move(subnets).unwrap(), parser.isSet(jsonOption));
    }

    if (command == QStringLiteral("find")) {
        if (positional.size() < 2) {
            QTextStream(stderr) << "Usage: voxlink find <hostname>\n";
            return voxlink::cli::kExitUsage;
        }
        return run_find(discovery_config, positional.at(1), parser.isSet(jsonOption));
    }

    if (command == QStringLiteral("listen")) {
        if (positional.size() < 2) {
            QTextStream(stderr) << "Usage: voxlink listen <host> [--port N] [--duration S]\n";
            return voxlink::cli::kExitUsage;
        }
        uint16_t port = discovery_config.service_port;
        if (parser.isSet(portOption)) {
            auto parsed = voxlink::cli::parse_port_option(parser.value(portOption));
            if (parsed.is_err()) {
                return usage_error(parsed.unwrap_err());
            }
            port = parsed.unwrap();
        }
        auto duration = voxlink::cli::parse_duration_option(parser.value(durationOption));
        if (duration.is_err()) {
            return usage_error(duration.unwrap_err());
        }
        return run_listen(app, connection_config, positional.at(1), port, duration.unwrap());
    }

    parser.showHelp(voxlink::cli::kExitUsage);
}
