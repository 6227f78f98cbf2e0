#include "core/mcp/McpServer.hpp"
#include "core/mcp/JsonRpc.hpp"
#include "core/mcp/ToolRegistry.hpp"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace notch {

using jsonrpc::errReply;
using jsonrpc::okReply;

McpServer::McpServer(ToolRegistry* tools, Writer writer, QObject* parent)
    : QObject(parent)
    , tools_(tools)
    , writer_(std::move(writer))
{
    // Interactive tools park a pool thread for up to a minute each
    pool_.setMaxThreadCount(std::max(8, QThread::idealThreadCount()));
}

McpServer::~McpServer()
{
    waitForPendingCalls();
}

void McpServer::setServerInfo(const QString& name, const QString& version)
{
    serverName_ = name;
    serverVersion_ = version;
}

void McpServer::registerResource(const QString& uri, const QString& name,
                                 const QString& description, ResourceReader reader)
{
    resources_[uri] = Resource{name, description, std::move(reader)};
}

void McpServer::registerPrompt(const QString& name, const QString& description,
                               PromptRenderer renderer)
{
    prompts_.append(Prompt{name, description, std::move(renderer)});
}

void McpServer::send(const QJsonObject& message)
{
    QByteArray data = QJsonDocument(message).toJson(QJsonDocument::Compact);
    BOOST_LOG_TRIVIAL(trace) << "[McpServer] >> " << data.left(200).constData();
    data.append('\n');

    QMutexLocker lock(&outputMutex_);
    if (writer_)
        writer_(data);
}

void McpServer::notifyResourceUpdated(const QString& uri)
{
    if (!isSubscribed(uri))
        return;
    send(jsonrpc::notification(QStringLiteral("notifications/resources/updated"),
                               QJsonObject{{"uri", uri}}));
}

bool McpServer::isSubscribed(const QString& uri) const
{
    QMutexLocker lock(&subscriptionMutex_);
    return subscriptions_.contains(uri);
}

void McpServer::waitForPendingCalls()
{
    pool_.waitForDone();
}

void McpServer::handleLine(const QByteArray& line)
{
    BOOST_LOG_TRIVIAL(trace) << "[McpServer] << " << line.trimmed().left(200).constData();

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[McpServer] Unparseable request: "
                                   << err.errorString().toStdString();
        send(errReply(QJsonValue(), jsonrpc::kParseError, QStringLiteral("Parse error")));
        return;
    }

    const QJsonObject req = doc.object();
    const QJsonValue id = req.value("id");
    const QString method = req.value("method").toString();
    const QJsonObject params = req.value("params").toObject();

    // Client notifications (no response)
    if (method.startsWith(QLatin1String("notifications/"))) {
        BOOST_LOG_TRIVIAL(debug) << "[McpServer] Client notification " << method.toStdString();
        return;
    }

    if (method == QLatin1String("initialize"))
        send(handleInitialize(id));
    else if (method == QLatin1String("ping"))
        send(okReply(id, QJsonObject{}));
    else if (method == QLatin1String("tools/list"))
        send(okReply(id, QJsonObject{{"tools", tools_->toolList()}}));
    else if (method == QLatin1String("tools/call"))
        handleToolsCall(id, params);
    else if (method == QLatin1String("resources/list"))
        send(handleResourcesList(id));
    else if (method == QLatin1String("resources/read"))
        send(handleResourcesRead(id, params));
    else if (method == QLatin1String("resources/subscribe"))
        send(handleSubscription(id, params, true));
    else if (method == QLatin1String("resources/unsubscribe"))
        send(handleSubscription(id, params, false));
    else if (method == QLatin1String("prompts/list"))
        send(handlePromptsList(id));
    else if (method == QLatin1String("prompts/get"))
        send(handlePromptsGet(id, params));
    else
        send(errReply(id, jsonrpc::kMethodNotFound, QStringLiteral("Method not found: ") + method));
}

QJsonObject McpServer::handleInitialize(const QJsonValue& id)
{
    QJsonObject caps;
    caps["tools"] = QJsonObject{{"listChanged", false}};
    caps["resources"] = QJsonObject{{"subscribe", true}, {"listChanged", false}};
    caps["prompts"] = QJsonObject{{"listChanged", false}};

    QJsonObject result{
        {"protocolVersion", kProtocolVersion},
        {"capabilities", caps},
        {"serverInfo", QJsonObject{
            {"name", serverName_},
            {"version", serverVersion_}
        }}
    };
    BOOST_LOG_TRIVIAL(info) << "[McpServer] Client initialized";
    return okReply(id, result);
}

void McpServer::handleToolsCall(const QJsonValue& id, const QJsonObject& params)
{
    const QString name = params.value("name").toString();
    const QJsonValue rawArgs = params.value("arguments");
    if (name.isEmpty()) {
        send(errReply(id, jsonrpc::kInvalidParams, QStringLiteral("Missing tool name")));
        return;
    }
    if (!rawArgs.isUndefined() && !rawArgs.isNull() && !rawArgs.isObject()) {
        send(errReply(id, jsonrpc::kInvalidParams, QStringLiteral("Arguments must be an object")));
        return;
    }
    const QJsonObject args = rawArgs.toObject();

    BOOST_LOG_TRIVIAL(debug) << "[McpServer] tools/call " << name.toStdString();
    pool_.start([this, id, name, args] {
        ToolResult r = tools_->call(name, args);
        if (r.isProtocolError())
            send(errReply(id, r.errorCode, r.errorMessage));
        else
            send(okReply(id, r.result));
    });
}

QJsonObject McpServer::handleResourcesList(const QJsonValue& id)
{
    QJsonArray list;
    for (auto it = resources_.constBegin(); it != resources_.constEnd(); ++it) {
        list.append(QJsonObject{
            {"uri", it.key()},
            {"name", it->name},
            {"description", it->description},
            {"mimeType", "application/json"}
        });
    }
    return okReply(id, QJsonObject{{"resources", list}});
}

QJsonObject McpServer::handleResourcesRead(const QJsonValue& id, const QJsonObject& params)
{
    const QString uri = params.value("uri").toString();
    auto it = resources_.constFind(uri);
    if (it == resources_.constEnd())
        return errReply(id, jsonrpc::kInvalidParams, QStringLiteral("Unknown resource: ") + uri);

    QJsonObject content{
        {"uri", uri},
        {"mimeType", "application/json"},
        {"text", QString::fromUtf8(it->reader())}
    };
    return okReply(id, QJsonObject{{"contents", QJsonArray{content}}});
}

QJsonObject McpServer::handleSubscription(const QJsonValue& id, const QJsonObject& params,
                                          bool subscribe)
{
    const QString uri = params.value("uri").toString();
    if (!resources_.contains(uri))
        return errReply(id, jsonrpc::kInvalidParams, QStringLiteral("Unknown resource: ") + uri);

    QMutexLocker lock(&subscriptionMutex_);
    if (subscribe)
        subscriptions_.insert(uri);
    else
        subscriptions_.remove(uri);
    return okReply(id, QJsonObject{});
}

QJsonObject McpServer::handlePromptsList(const QJsonValue& id)
{
    QJsonArray list;
    for (const auto& p : prompts_) {
        list.append(QJsonObject{
            {"name", p.name},
            {"description", p.description},
            {"arguments", QJsonArray{}}
        });
    }
    return okReply(id, QJsonObject{{"prompts", list}});
}

QJsonObject McpServer::handlePromptsGet(const QJsonValue& id, const QJsonObject& params)
{
    const QString name = params.value("name").toString();
    auto it = std::find_if(prompts_.cbegin(), prompts_.cend(),
                           [&](const Prompt& p) { return p.name == name; });
    if (it == prompts_.cend())
        return errReply(id, jsonrpc::kInvalidParams, QStringLiteral("Unknown prompt: ") + name);

    QJsonObject message{
        {"role", "user"},
        {"content", QJsonObject{
            {"type", "text"},
            {"text", it->renderer(params.value("arguments").toObject())}
        }}
    };
    return okReply(id, QJsonObject{
        {"description", it->description},
        {"messages", QJsonArray{message}}
    });
}

} // namespace notch
