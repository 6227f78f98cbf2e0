#include "core/store/PendingAction.hpp"
#include <QJsonArray>

namespace notch {

QJsonObject PendingAction::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["message"] = message;
    obj["type"] = kind;
    obj["actions"] = QJsonArray::fromStringList(actions);
    obj["timestamp"] = timestamp.toUTC().toString(Qt::ISODateWithMs);
    if (userChoice)
        obj["userChoice"] = *userChoice;
    else
        obj["userChoice"] = QJsonValue::Null;
    return obj;
}

std::optional<PendingAction> PendingAction::fromJson(const QJsonObject& obj)
{
    if (!obj.value("id").isString() || !obj.value("actions").isArray())
        return std::nullopt;

    PendingAction a;
    a.id = obj.value("id").toString();
    a.title = obj.value("title").toString();
    a.message = obj.value("message").toString();
    a.kind = obj.value("type").toString(QStringLiteral("info"));
    for (const auto& v : obj.value("actions").toArray()) {
        if (v.isString())
            a.actions.append(v.toString());
    }
    a.timestamp = QDateTime::fromString(obj.value("timestamp").toString(), Qt::ISODateWithMs);
    if (!a.timestamp.isValid())
        return std::nullopt;

    const QJsonValue choice = obj.value("userChoice");
    if (choice.isString())
        a.userChoice = choice.toString();
    return a;
}

} // namespace notch
