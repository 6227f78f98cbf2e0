#include "core/NotificationCodec.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <limits>

namespace notch {

namespace {

DecodeResult fail(const QString& error)
{
    DecodeResult result;
    result.error = error;
    return result;
}

// Present-but-null counts as absent, matching optional fields on the wire.
bool isAbsent(const QJsonValue& v)
{
    return v.isUndefined() || v.isNull();
}

} // namespace

DecodeResult decodeNotification(const QByteArray& data)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data.trimmed(), &err);
    if (err.error != QJsonParseError::NoError)
        return fail(QStringLiteral("Invalid JSON: ") + err.errorString());
    if (!doc.isObject())
        return fail(QStringLiteral("Invalid JSON: expected an object"));

    const QJsonObject obj = doc.object();
    Notification n;

    const QJsonValue title = obj.value("title");
    if (!title.isString())
        return fail(QStringLiteral("Missing or invalid field: title"));
    n.title = title.toString();

    const QJsonValue message = obj.value("message");
    if (!message.isString())
        return fail(QStringLiteral("Missing or invalid field: message"));
    n.message = message.toString();

    const QJsonValue type = obj.value("type");
    if (!isAbsent(type)) {
        if (!type.isString())
            return fail(QStringLiteral("Invalid field: type"));
        n.kind = kindFromString(type.toString());
    }

    const QJsonValue priority = obj.value("priority");
    if (!isAbsent(priority)) {
        double raw = priority.toDouble(std::nan(""));
        if (!priority.isDouble() || std::floor(raw) != raw
            || raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max())
            return fail(QStringLiteral("Invalid field: priority"));
        n.priority = priorityFromInt(static_cast<int>(raw));
    }

    const QJsonValue icon = obj.value("icon");
    if (!isAbsent(icon)) {
        if (!icon.isString())
            return fail(QStringLiteral("Invalid field: icon"));
        n.icon = icon.toString();
    }

    const QJsonValue actions = obj.value("actions");
    if (!isAbsent(actions)) {
        if (!actions.isArray())
            return fail(QStringLiteral("Invalid field: actions"));
        const QJsonArray list = actions.toArray();
        for (int i = 0; i < list.size(); ++i) {
            const QJsonObject entry = list.at(i).toObject();
            const QJsonValue label = entry.value("label");
            const QJsonValue action = entry.value("action");
            if (!label.isString() || !action.isString())
                return fail(QStringLiteral("Invalid action at index %1").arg(i));

            NotificationAction a;
            a.label = label.toString();
            a.action = action.toString();
            const QJsonValue style = entry.value("style");
            if (!isAbsent(style)) {
                if (!style.isString())
                    return fail(QStringLiteral("Invalid action style at index %1").arg(i));
                a.style = styleFromString(style.toString());
            }
            n.actions.append(a);
        }
    }

    const QJsonValue metadata = obj.value("metadata");
    if (!isAbsent(metadata)) {
        if (!metadata.isObject())
            return fail(QStringLiteral("Invalid field: metadata"));
        const QJsonObject map = metadata.toObject();
        for (auto it = map.begin(); it != map.end(); ++it) {
            if (!it.value().isString())
                return fail(QStringLiteral("Invalid metadata value for key: ") + it.key());
            n.metadata.insert(it.key(), it.value().toString());
        }
    }

    n.timestamp = QDateTime::currentDateTimeUtc();

    DecodeResult result;
    result.notification = std::move(n);
    return result;
}

QJsonObject notificationToJson(const Notification& n)
{
    QJsonObject obj;
    obj["title"] = n.title;
    obj["message"] = n.message;
    obj["type"] = kindToString(n.kind);
    obj["priority"] = static_cast<int>(n.priority);
    if (!n.icon.isEmpty())
        obj["icon"] = n.icon;

    if (!n.actions.isEmpty()) {
        QJsonArray actions;
        for (const auto& a : n.actions) {
            actions.append(QJsonObject{
                {"label", a.label},
                {"action", a.action},
                {"style", styleToString(a.style)}
            });
        }
        obj["actions"] = actions;
    }

    if (!n.metadata.isEmpty()) {
        QJsonObject metadata;
        for (auto it = n.metadata.constBegin(); it != n.metadata.constEnd(); ++it)
            metadata[it.key()] = it.value();
        obj["metadata"] = metadata;
    }
    return obj;
}

QByteArray encodeNotification(const Notification& n)
{
    return QJsonDocument(notificationToJson(n)).toJson(QJsonDocument::Compact);
}

QString makeActionToken(const QString& requestId, const QString& label)
{
    return QString::fromLatin1(kActionTokenTag) + ':' + requestId + ':' + label;
}

std::optional<ActionToken> parseActionToken(const QString& token)
{
    const QString prefix = QString::fromLatin1(kActionTokenTag) + ':';
    if (!token.startsWith(prefix))
        return std::nullopt;

    const int sep = token.indexOf(':', prefix.size());
    if (sep < 0)
        return std::nullopt;

    ActionToken parsed;
    parsed.requestId = token.mid(prefix.size(), sep - prefix.size());
    parsed.label = token.mid(sep + 1);
    if (parsed.requestId.isEmpty())
        return std::nullopt;
    return parsed;
}

QByteArray successAck()
{
    return QByteArrayLiteral("{\"success\":true}\n");
}

QByteArray errorAck(const QString& error)
{
    QJsonObject obj{{"success", false}, {"error", error}};
    return QJsonDocument(obj).toJson(QJsonDocument::Compact) + '\n';
}

} // namespace notch
