#include "core/Notification.hpp"
#include "core/NotificationCodec.hpp"
#include <QHash>

namespace notch {

namespace {

const QHash<QString, NotificationKind>& kindTable()
{
    static const QHash<QString, NotificationKind> table = {
        {"info", NotificationKind::Info},
        {"success", NotificationKind::Success},
        {"warning", NotificationKind::Warning},
        {"error", NotificationKind::Error},
        {"hook", NotificationKind::Hook},
        {"tool_use", NotificationKind::ToolUse},
        {"progress", NotificationKind::Progress},
        {"celebration", NotificationKind::Celebration},
        {"reminder", NotificationKind::Reminder},
        {"download", NotificationKind::Download},
        {"upload", NotificationKind::Upload},
        {"security", NotificationKind::Security},
        {"ai", NotificationKind::Ai},
        {"sync", NotificationKind::Sync},
    };
    return table;
}

} // namespace

QString kindToString(NotificationKind kind)
{
    return kindTable().key(kind, QStringLiteral("info"));
}

NotificationKind kindFromString(const QString& value)
{
    return kindTable().value(value, NotificationKind::Info);
}

QString styleToString(ActionStyle style)
{
    switch (style) {
    case ActionStyle::Primary: return QStringLiteral("primary");
    case ActionStyle::Destructive: return QStringLiteral("destructive");
    case ActionStyle::Normal: break;
    }
    return QStringLiteral("normal");
}

ActionStyle styleFromString(const QString& value)
{
    if (value == QLatin1String("primary")) return ActionStyle::Primary;
    if (value == QLatin1String("destructive")) return ActionStyle::Destructive;
    return ActionStyle::Normal;
}

Priority priorityFromInt(int value)
{
    if (value < static_cast<int>(Priority::Low) || value > static_cast<int>(Priority::Urgent))
        return Priority::Normal;
    return static_cast<Priority>(value);
}

bool isActionable(const Notification& notification)
{
    for (const auto& action : notification.actions) {
        if (parseActionToken(action.action))
            return true;
    }
    return false;
}

} // namespace notch
