#pragma once

#include "core/Notification.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace notch {

/// Protocol tag for action tokens that must be reported back to a waiting
/// tool process: "mcp_action:<requestId>:<label>".
inline constexpr char kActionTokenTag[] = "mcp_action";

struct ActionToken {
    QString requestId;
    QString label;
};

struct DecodeResult {
    std::optional<Notification> notification;
    QString error;

    bool ok() const { return notification.has_value(); }
};

/// Decode one envelope as sent over the ingestion socket.
/// Requires string "title" and "message"; everything else is optional but
/// must have the documented shape when present.
DecodeResult decodeNotification(const QByteArray& data);

QJsonObject notificationToJson(const Notification& notification);
QByteArray encodeNotification(const Notification& notification);

QString makeActionToken(const QString& requestId, const QString& label);

/// Splits on the first two colons only; labels may contain ':'.
std::optional<ActionToken> parseActionToken(const QString& token);

QByteArray successAck();
QByteArray errorAck(const QString& error);

} // namespace notch
