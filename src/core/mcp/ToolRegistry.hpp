#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QString>
#include <functional>

namespace notch {

/// Outcome of one tools/call. Either an MCP CallToolResult or a JSON-RPC
/// error (errorCode != 0) for calls the server must refuse.
struct ToolResult {
    QJsonObject result;
    int errorCode = 0;
    QString errorMessage;

    bool isProtocolError() const { return errorCode != 0; }

    static ToolResult text(const QString& text, bool isError = false);
    static ToolResult invalidParams(const QString& message);
};

/// Registry of named MCP tools. Registration happens once on the main thread
/// before serving; call() may run concurrently on pool threads.
class ToolRegistry {
public:
    using Handler = std::function<ToolResult(const QJsonObject& arguments)>;

    void registerTool(const QString& name, const QString& description,
                      const QJsonObject& inputSchema, Handler handler);

    /// Unknown names produce an invalid-params error.
    ToolResult call(const QString& name, const QJsonObject& arguments) const;

    /// The "tools" array for tools/list, sorted by name.
    QJsonArray toolList() const;

private:
    struct Entry {
        QString description;
        QJsonObject inputSchema;
        Handler handler;
    };

    QMap<QString, Entry> tools_;
    mutable QMutex mutex_;
};

} // namespace notch
