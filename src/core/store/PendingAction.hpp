#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

namespace notch {

/// One actionable request waiting for a user choice. Persisted as a value in
/// the store's JSON map, keyed by id.
struct PendingAction {
    QString id;
    QString title;
    QString message;
    QString kind;
    QStringList actions;
    QDateTime timestamp;
    std::optional<QString> userChoice;

    QJsonObject toJson() const;
    static std::optional<PendingAction> fromJson(const QJsonObject& obj);
};

} // namespace notch
