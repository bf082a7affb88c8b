#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <ngd/Image/ImageDescriptor.hpp>
#include <ngd/Sender/NotificationSender.hpp>
#include <ngd/Text/StringPolicy.hpp>
#include <ngd/Transport/DBusNotificationTransport.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/ProxyServer.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("notify-guard-proxy");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Sanitizing proxy for desktop notifications");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path",
                                    "/etc/notify-guard/config.yaml");
    parser.addOption(configOption);
    parser.process(app);

    // Missing file: built-in defaults
    ngp::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath))
        config.load(configPath);
    else
        BOOST_LOG_TRIVIAL(info) << "No config at " << configPath.toStdString() << ", using defaults";

    ngp::applyLogLevel(config.logLevel());

    ngd::registerImageDescriptorMetaType();

    ngd::DBusEndpoint endpoint;
    endpoint.service = config.service();
    endpoint.path = config.objectPath();
    endpoint.interface = config.interfaceName();
    endpoint.systemBus = config.busType() == QLatin1String("system");
    endpoint.callTimeoutMs = config.callTimeoutMs();

    auto* transport = new ngd::DBusNotificationTransport(endpoint, &app);
    if (!transport->isConnected())
        BOOST_LOG_TRIVIAL(warning) << "D-Bus connection not available; notify calls will fail";

    auto* sender = new ngd::NotificationSender(transport, &app);

    const ngd::ControlCharacterPolicy controlCharacters;

    auto* server = new ngp::ProxyServer(sender, &app);
    server->setMaxRequestBytes(config.maxRequestBytes());
    server->setForwardEvents(config.forwardEvents());
    if (config.rejectControlCharacters()) {
        server->setStringPolicy(&controlCharacters);
        BOOST_LOG_TRIVIAL(info) << "Rejecting control characters in notification text";
    }
    if (!server->start(config.socketPath()))
        return 1;

    // SIGINT/SIGTERM -> leave the event loop, remove the socket
    static QCoreApplication* g_app = &app;
    auto onTerminate = [](int) {
        QMetaObject::invokeMethod(g_app, []() { QCoreApplication::quit(); },
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, onTerminate);
    signal(SIGTERM, onTerminate);

    const int rc = app.exec();
    server->stop();
    server->setStringPolicy(nullptr);
    BOOST_LOG_TRIVIAL(info) << "notify-guard-proxy exiting";
    return rc;
}
