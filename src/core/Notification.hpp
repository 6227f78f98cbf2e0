#pragma once

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>

namespace notch {

enum class NotificationKind {
    Info,
    Success,
    Warning,
    Error,
    Hook,
    ToolUse,
    Progress,
    Celebration,
    Reminder,
    Download,
    Upload,
    Security,
    Ai,
    Sync
};

// Wire values are the integers 0..3.
enum class Priority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

enum class ActionStyle {
    Normal,
    Primary,
    Destructive
};

struct NotificationAction {
    QString label;
    QString action;     // opaque token handed back on tap
    ActionStyle style = ActionStyle::Normal;
};

struct Notification {
    QString id;         // assigned by the display pipeline, empty on the wire
    QString title;
    QString message;
    NotificationKind kind = NotificationKind::Info;
    Priority priority = Priority::Normal;
    QString icon;
    QList<NotificationAction> actions;
    QMap<QString, QString> metadata;
    QDateTime timestamp;
};

QString kindToString(NotificationKind kind);
/// Unknown strings map to NotificationKind::Info.
NotificationKind kindFromString(const QString& value);

QString styleToString(ActionStyle style);
ActionStyle styleFromString(const QString& value);

/// Out-of-range values map to Priority::Normal.
Priority priorityFromInt(int value);

/// True when at least one action carries an mcp_action token.
bool isActionable(const Notification& notification);

} // namespace notch

Q_DECLARE_METATYPE(notch::Notification)
