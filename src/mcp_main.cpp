#include <signal.h>
#include <unistd.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <memory>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/mcp/LineReader.hpp"
#include "core/mcp/McpServer.hpp"
#include "core/mcp/NotchTools.hpp"
#include "core/mcp/ToolRegistry.hpp"
#include "core/store/PendingActionStore.hpp"
#include "core/store/PendingActionWatcher.hpp"
#include "core/transport/IngestionClient.hpp"

// MCP stdio server. stdout carries protocol traffic only; every log line
// goes to stderr.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("notch-mcp");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("MCP server for notch notifications (stdio)");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "path",
                                    notch::YamlConfig::defaultConfigPath());
    parser.addOption(configOption);
    parser.process(app);

    const QString configPath = parser.value(configOption);
    notch::YamlConfig config;
    if (QFile::exists(configPath) && !config.load(configPath))
        qWarning() << "notch-mcp: invalid config" << configPath << "- using defaults";
    notch::initLogging(config.logLevel());

    notch::PendingActionStore store(config.storePath(), config.storeLockPath());
    notch::IngestionClient client(config.socketPath(), config.socketSendTimeoutMs());

    notch::NotchTools::Options toolOptions;
    toolOptions.pollIntervalMs = config.pollIntervalMs();
    toolOptions.maxPolls = config.maxPolls();
    notch::NotchTools tools(&store, client, toolOptions);
    notch::ToolRegistry registry;

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        qCritical() << "notch-mcp: cannot open stdout";
        return 1;
    }

    notch::McpServer server(&registry, [&out](const QByteArray& line) {
        out.write(line);
        out.flush();
    });
    server.setServerInfo("notch-relay", app.applicationVersion());
    tools.install(registry, server);

    std::unique_ptr<notch::PendingActionWatcher> watcher;
    if (config.watchStore()) {
        watcher = std::make_unique<notch::PendingActionWatcher>(config.storePath(), [&tools, &server]() {
            tools.storeChanged();
            server.notifyResourceUpdated(notch::NotchTools::kPendingActionsUri);
        });
        if (watcher->watch()) {
            tools.setStoreWatched(true);
        } else {
            qWarning() << "notch-mcp: store watcher unavailable, polling only";
            watcher.reset();
        }
    }

    notch::LineReader reader(STDIN_FILENO);
    QObject::connect(&reader, &notch::LineReader::lineReceived, &server, &notch::McpServer::handleLine);
    QObject::connect(&reader, &notch::LineReader::endOfInput, &app, [&server]() {
        qInfo() << "notch-mcp: stdin closed, finishing outstanding calls";
        server.waitForPendingCalls();
        QCoreApplication::quit();
    });
    reader.start();

    signal(SIGPIPE, SIG_IGN);
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });

    int ret = app.exec();

    reader.requestStop();
    reader.wait();
    server.waitForPendingCalls();
    return ret;
}
