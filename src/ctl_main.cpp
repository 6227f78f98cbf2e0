#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <chrono>
#include "core/Logging.hpp"
#include "core/Notification.hpp"
#include "core/YamlConfig.hpp"
#include "core/store/PendingActionStore.hpp"
#include "core/transport/IngestionClient.hpp"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usage(const QCommandLineParser& parser)
{
    err() << parser.helpText() << "\n"
          << "Commands:\n"
          << "  send --title T --message M [--type K] [--priority N]\n"
          << "  pending\n"
          << "  choose <id> <label>\n"
          << "  remove <id>\n"
          << "  sweep [--max-age SECONDS]\n";
    err().flush();
    return 2;
}

} // namespace

// Operator CLI for the display socket and the pending-action store.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("notchctl");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Control tool for notch-relay");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "path",
                                    notch::YamlConfig::defaultConfigPath());
    QCommandLineOption titleOption("title", "Notification title.", "text");
    QCommandLineOption messageOption("message", "Notification message.", "text");
    QCommandLineOption typeOption("type", "Notification kind.", "kind", "info");
    QCommandLineOption priorityOption("priority", "Priority 0-3.", "n", "1");
    QCommandLineOption maxAgeOption("max-age", "Sweep records older than this.", "seconds");
    parser.addOptions({configOption, titleOption, messageOption, typeOption,
                       priorityOption, maxAgeOption});
    parser.addPositionalArgument("command", "send | pending | choose | remove | sweep");
    parser.process(app);

    const QString configPath = parser.value(configOption);
    notch::YamlConfig config;
    if (QFile::exists(configPath) && !config.load(configPath))
        qWarning() << "notchctl: invalid config" << configPath << "- using defaults";
    notch::initLogging(config.logLevel());

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usage(parser);
    const QString command = args.first();

    if (command == "send") {
        if (!parser.isSet(titleOption) || !parser.isSet(messageOption))
            return usage(parser);
        notch::Notification n;
        n.title = parser.value(titleOption);
        n.message = parser.value(messageOption);
        n.kind = notch::kindFromString(parser.value(typeOption));
        n.priority = notch::priorityFromInt(parser.value(priorityOption).toInt());
        n.metadata.insert("source", "notchctl");

        notch::IngestionClient client(config.socketPath(), config.socketSendTimeoutMs());
        notch::SendResult result = client.send(n);
        if (!result.acknowledged) {
            err() << "send failed: " << result.error << "\n";
            return 1;
        }
        out() << "{\"success\":true}\n";
        return 0;
    }

    notch::PendingActionStore store(config.storePath(), config.storeLockPath());

    if (command == "pending") {
        QJsonArray list;
        for (const auto& action : store.listPending())
            list.append(action.toJson());
        out() << QJsonDocument(list).toJson(QJsonDocument::Indented);
        return 0;
    }

    if (command == "choose") {
        if (args.size() != 3)
            return usage(parser);
        store.setChoice(args.at(1), args.at(2));
        return 0;
    }

    if (command == "remove") {
        if (args.size() != 2)
            return usage(parser);
        store.remove(args.at(1));
        return 0;
    }

    if (command == "sweep") {
        int maxAge = config.staleAfterSec();
        if (parser.isSet(maxAgeOption)) {
            bool ok = false;
            maxAge = parser.value(maxAgeOption).toInt(&ok);
            if (!ok || maxAge < 0)
                return usage(parser);
        }
        if (maxAge <= 0) {
            err() << "sweep: no --max-age given and store.stale_after_sec is 0\n";
            return 2;
        }
        out() << store.sweepStale(std::chrono::seconds(maxAge)) << " removed\n";
        return 0;
    }

    return usage(parser);
}
