#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QDebug>
#include <QTimer>
#include <algorithm>
#include <chrono>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/NotificationService.hpp"
#include "core/store/PendingActionStore.hpp"
#include "core/transport/IngestionServer.hpp"

// Headless display daemon: receives notifications on the ingestion socket,
// keeps them in the NotificationService and logs them.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("notch-display");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Notification display daemon");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "path",
                                    notch::YamlConfig::defaultConfigPath());
    parser.addOption(configOption);
    parser.process(app);

    const QString configPath = parser.value(configOption);
    notch::YamlConfig config;
    if (QFile::exists(configPath) && !config.load(configPath))
        qWarning() << "notch-display: invalid config" << configPath << "- using defaults";
    notch::initLogging(config.logLevel());

    qRegisterMetaType<notch::Notification>();

    notch::PendingActionStore store(config.storePath(), config.storeLockPath());

    // --- NotificationService ---
    auto notificationService = new notch::NotificationService(&store, &app);
    QObject::connect(notificationService, &notch::NotificationService::notificationAdded,
                     [](const notch::Notification& n) {
        qInfo().noquote() << "Notification:" << n.id << "[" + notch::kindToString(n.kind) + "]"
                          << n.title << "-" << n.message
                          << (notch::isActionable(n) ? "(actionable)" : "");
        for (const auto& a : n.actions)
            qInfo().noquote() << "  action:" << a.label << "->" << a.action;
    });
    QObject::connect(notificationService, &notch::NotificationService::notificationRemoved,
                     [](const QString& id) { qInfo().noquote() << "Dismissed:" << id; });
    QObject::connect(notificationService, &notch::NotificationService::actionActivated,
                     [](const QString& requestId, const QString& label) {
        qInfo().noquote() << "Choice for" << requestId << ":" << label;
    });

    // --- Ingestion socket ---
    // Connections are served on pool threads; hop to the main thread to post.
    notch::IngestionServer server([notificationService](const notch::Notification& n) {
        QMetaObject::invokeMethod(notificationService, [notificationService, n]() {
            notificationService->post(n);
        }, Qt::QueuedConnection);
    });

    notch::IngestionServer::Options options;
    options.backlog = config.socketBacklog();
    options.bufferBytes = config.socketBufferBytes();
    options.receiveTimeoutMs = config.socketReceiveTimeoutMs();
    options.sendTimeoutMs = config.socketSendTimeoutMs();
    if (!server.start(config.socketPath(), options)) {
        qCritical() << "notch-display: cannot listen on" << config.socketPath();
        return 1;
    }

    // --- Orphan sweeper (late clicks after a timeout) ---
    const int staleAfter = config.staleAfterSec();
    if (staleAfter > 0) {
        auto sweep = [&store, staleAfter]() { store.sweepStale(std::chrono::seconds(staleAfter)); };
        auto sweepTimer = new QTimer(&app);
        sweepTimer->setInterval(std::min(staleAfter, 60) * 1000);
        QObject::connect(sweepTimer, &QTimer::timeout, sweep);
        sweepTimer->start();
        sweep();
        qInfo() << "Sweeping pending actions older than" << staleAfter << "s";
    }

    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });

    int ret = app.exec();

    // Stop accepting before the service the handler posts into goes away
    server.stop();
    return ret;
}
