#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace notch {
namespace jsonrpc {

constexpr int kParseError = -32700;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

inline QJsonObject okReply(const QJsonValue& id, const QJsonObject& result)
{
    return QJsonObject{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline QJsonObject errReply(const QJsonValue& id, int code, const QString& msg)
{
    return QJsonObject{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", QJsonObject{{"code", code}, {"message", msg}}}
    };
}

inline QJsonObject notification(const QString& method, const QJsonObject& params = {})
{
    QJsonObject n{{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.isEmpty())
        n["params"] = params;
    return n;
}

} // namespace jsonrpc
} // namespace notch
