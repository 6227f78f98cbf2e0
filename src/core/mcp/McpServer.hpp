#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QThreadPool>
#include <functional>

namespace notch {

class ToolRegistry;

/// MCP (JSON-RPC 2.0, newline-delimited) server core.
///
/// Requests are dispatched on the thread that calls handleLine(). tools/call
/// is pushed to a thread pool because tools may block for a long time; every
/// outgoing line goes through one mutex-guarded writer so replies and
/// notifications never interleave.
class McpServer : public QObject {
    Q_OBJECT

public:
    using Writer = std::function<void(const QByteArray& line)>;
    using ResourceReader = std::function<QByteArray()>;
    using PromptRenderer = std::function<QString(const QJsonObject& arguments)>;

    static constexpr const char* kProtocolVersion = "2024-11-05";

    McpServer(ToolRegistry* tools, Writer writer, QObject* parent = nullptr);
    ~McpServer() override;

    void setServerInfo(const QString& name, const QString& version);

    void registerResource(const QString& uri, const QString& name,
                          const QString& description, ResourceReader reader);
    void registerPrompt(const QString& name, const QString& description,
                        PromptRenderer renderer);

    /// Emit notifications/resources/updated if a client subscribed to uri.
    /// Safe from any thread.
    void notifyResourceUpdated(const QString& uri);
    bool isSubscribed(const QString& uri) const;

    /// Block until all in-flight tool calls have replied.
    void waitForPendingCalls();

public slots:
    void handleLine(const QByteArray& line);

private:
    struct Resource {
        QString name;
        QString description;
        ResourceReader reader;
    };

    struct Prompt {
        QString name;
        QString description;
        PromptRenderer renderer;
    };

    void send(const QJsonObject& message);

    QJsonObject handleInitialize(const QJsonValue& id);
    QJsonObject handleResourcesList(const QJsonValue& id);
    QJsonObject handleResourcesRead(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleSubscription(const QJsonValue& id, const QJsonObject& params, bool subscribe);
    QJsonObject handlePromptsList(const QJsonValue& id);
    QJsonObject handlePromptsGet(const QJsonValue& id, const QJsonObject& params);
    void handleToolsCall(const QJsonValue& id, const QJsonObject& params);

    ToolRegistry* tools_;
    Writer writer_;
    QString serverName_ = QStringLiteral("notch-relay");
    QString serverVersion_ = QStringLiteral("1.0.0");

    QMap<QString, Resource> resources_;
    QList<Prompt> prompts_;

    QMutex outputMutex_;
    mutable QMutex subscriptionMutex_;
    QSet<QString> subscriptions_;
    QThreadPool pool_;
};

} // namespace notch
