#include "core/mcp/ToolRegistry.hpp"
#include "core/mcp/JsonRpc.hpp"
#include <boost/log/trivial.hpp>

namespace notch {

ToolResult ToolResult::text(const QString& text, bool isError)
{
    QJsonObject entry{{"type", "text"}, {"text", text}};
    ToolResult r;
    r.result["content"] = QJsonArray{entry};
    if (isError)
        r.result["isError"] = true;
    return r;
}

ToolResult ToolResult::invalidParams(const QString& message)
{
    ToolResult r;
    r.errorCode = jsonrpc::kInvalidParams;
    r.errorMessage = message;
    return r;
}

void ToolRegistry::registerTool(const QString& name, const QString& description,
                                const QJsonObject& inputSchema, Handler handler)
{
    QMutexLocker lock(&mutex_);
    tools_[name] = Entry{description, inputSchema, std::move(handler)};
}

ToolResult ToolRegistry::call(const QString& name, const QJsonObject& arguments) const
{
    Handler handler;
    {
        QMutexLocker lock(&mutex_);
        auto it = tools_.constFind(name);
        if (it == tools_.constEnd()) {
            BOOST_LOG_TRIVIAL(debug) << "[ToolRegistry] unknown tool '" << name.toStdString() << "'";
            return ToolResult::invalidParams(QStringLiteral("Unknown tool: ") + name);
        }
        handler = it->handler;  // run outside the lock, calls can block for a long time
    }
    return handler(arguments);
}

QJsonArray ToolRegistry::toolList() const
{
    QMutexLocker lock(&mutex_);
    QJsonArray list;
    for (auto it = tools_.constBegin(); it != tools_.constEnd(); ++it) {
        list.append(QJsonObject{
            {"name", it.key()},
            {"description", it->description},
            {"inputSchema", it->inputSchema}
        });
    }
    return list;
}

} // namespace notch
