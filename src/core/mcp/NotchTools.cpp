#include "core/mcp/NotchTools.hpp"
#include "core/NotificationCodec.hpp"
#include "core/mcp/McpServer.hpp"
#include "core/store/IPendingActionStore.hpp"
#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>
#include <QUuid>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace notch {

namespace {

// Returns an error message, or an empty string when the key holds a string.
QString takeString(const QJsonObject& args, const char* key, QString& out)
{
    const QJsonValue v = args.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return QStringLiteral("Missing required argument: %1").arg(QLatin1String(key));
    if (!v.isString())
        return QStringLiteral("Argument '%1' must be a string").arg(QLatin1String(key));
    out = v.toString();
    return {};
}

QString takeOptionalString(const QJsonObject& args, const char* key, QString& out)
{
    const QJsonValue v = args.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return {};
    if (!v.isString())
        return QStringLiteral("Argument '%1' must be a string").arg(QLatin1String(key));
    out = v.toString();
    return {};
}

QString takeStringList(const QJsonObject& args, const char* key, QStringList& out, bool required)
{
    const QJsonValue v = args.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        if (required)
            return QStringLiteral("Missing required argument: %1").arg(QLatin1String(key));
        return {};
    }
    if (!v.isArray())
        return QStringLiteral("Argument '%1' must be an array of strings").arg(QLatin1String(key));
    for (const QJsonValue& item : v.toArray()) {
        if (!item.isString())
            return QStringLiteral("Argument '%1' must be an array of strings").arg(QLatin1String(key));
        out.append(item.toString());
    }
    return {};
}

QJsonObject stringProp(const QString& description)
{
    return QJsonObject{{"type", "string"}, {"description", description}};
}

QJsonObject stringArrayProp(const QString& description)
{
    return QJsonObject{
        {"type", "array"},
        {"items", QJsonObject{{"type", "string"}}},
        {"description", description}
    };
}

QJsonObject schema(const QJsonObject& properties, const QStringList& required)
{
    return QJsonObject{
        {"type", "object"},
        {"properties", properties},
        {"required", QJsonArray::fromStringList(required)}
    };
}

QJsonObject resolvedResult(const QString& requestId, const QString& choice)
{
    ToolResult r = ToolResult::text(choice);
    r.result["structuredContent"] = QJsonObject{
        {"status", "resolved"},
        {"choice", choice},
        {"request_id", requestId}
    };
    return r.result;
}

QJsonObject timeoutResult(const QString& requestId)
{
    ToolResult r = ToolResult::text(QStringLiteral("timeout"));
    r.result["structuredContent"] = QJsonObject{
        {"status", "timeout"},
        {"request_id", requestId}
    };
    r.result["isError"] = false;
    return r.result;
}

} // namespace

NotchTools::NotchTools(IPendingActionStore* store, const IngestionClient& client,
                       const Options& options)
    : store_(store)
    , client_(client)
    , options_(options)
    , idGenerator_([] { return QUuid::createUuid().toString(QUuid::WithoutBraces); })
{
}

void NotchTools::install(ToolRegistry& registry, McpServer& server)
{
    registry.registerTool(
        QStringLiteral("show_progress"),
        QStringLiteral("Show a progress notification in the notch"),
        schema(QJsonObject{
            {"title", stringProp(QStringLiteral("Task title"))},
            {"progress", QJsonObject{{"type", "number"}, {"minimum", 0}, {"maximum", 1},
                                     {"description", QStringLiteral("Progress from 0.0 to 1.0")}}},
            {"cancellable", QJsonObject{{"type", "boolean"},
                                        {"description", QStringLiteral("Whether the task can be cancelled")}}}
        }, {QStringLiteral("title"), QStringLiteral("progress")}),
        [this](const QJsonObject& a) { return showProgress(a); });

    registry.registerTool(
        QStringLiteral("show_result"),
        QStringLiteral("Show the result of an operation"),
        schema(QJsonObject{
            {"title", stringProp(QStringLiteral("Result title"))},
            {"type", stringProp(QStringLiteral("Notification kind, e.g. success, error, warning, info"))},
            {"message", stringProp(QStringLiteral("Details"))}
        }, {QStringLiteral("title"), QStringLiteral("type")}),
        [this](const QJsonObject& a) { return showResult(a); });

    registry.registerTool(
        QStringLiteral("ask_confirmation"),
        QStringLiteral("Show a confirmation prompt without waiting for the answer"),
        schema(QJsonObject{
            {"question", stringProp(QStringLiteral("Question to ask"))},
            {"options", stringArrayProp(QStringLiteral("Answer options"))}
        }, {QStringLiteral("question"), QStringLiteral("options")}),
        [this](const QJsonObject& a) { return askConfirmation(a); });

    registry.registerTool(
        QStringLiteral("show_actionable_result"),
        QStringLiteral("Show a notification with up to three buttons and wait for the user "
                       "to pick one. Returns the chosen label, or \"timeout\"."),
        schema(QJsonObject{
            {"title", stringProp(QStringLiteral("Notification title"))},
            {"message", stringProp(QStringLiteral("Notification body"))},
            {"type", stringProp(QStringLiteral("Notification kind (default info)"))},
            {"actions", QJsonObject{
                {"type", "array"},
                {"items", QJsonObject{{"type", "string"}}},
                {"minItems", 1},
                {"maxItems", kMaxActions},
                {"description", QStringLiteral("Button labels in display order")}}}
        }, {QStringLiteral("title"), QStringLiteral("message"), QStringLiteral("actions")}),
        [this](const QJsonObject& a) { return showActionableResult(a); });

    registry.registerTool(
        QStringLiteral("show_summary"),
        QStringLiteral("Show a summary of the current work session"),
        schema(QJsonObject{
            {"project_name", stringProp(QStringLiteral("Project name"))},
            {"task_description", stringProp(QStringLiteral("What the session worked on"))},
            {"project_path", stringProp(QStringLiteral("Project directory"))},
            {"completed_tasks", stringArrayProp(QStringLiteral("Finished tasks"))},
            {"pending_tasks", stringArrayProp(QStringLiteral("Remaining tasks"))},
            {"modified_files", stringArrayProp(QStringLiteral("Files touched"))},
            {"key_decisions", stringArrayProp(QStringLiteral("Notable decisions"))}
        }, {QStringLiteral("project_name"), QStringLiteral("task_description")}),
        [this](const QJsonObject& a) { return showSummary(a); });

    server.registerResource(
        QStringLiteral("notch://stats/session"), QStringLiteral("Session Statistics"),
        QStringLiteral("Statistics for the current work session"),
        [] { return QByteArrayLiteral("{\"error\":\"Statistics only available in GUI process\"}"); });
    server.registerResource(
        QStringLiteral("notch://notifications/history"), QStringLiteral("Notification History"),
        QStringLiteral("Recently shown notifications"),
        [] { return QByteArrayLiteral("{\"error\":\"Notification history only available in GUI process\"}"); });
    server.registerResource(
        QString::fromLatin1(kPendingActionsUri), QStringLiteral("Pending Action Notifications"),
        QStringLiteral("Interactive notifications waiting for user action"),
        [this] { return pendingActionsJson(); });

    server.registerPrompt(
        QStringLiteral("work_summary"),
        QStringLiteral("Generate a summary of the current work session"),
        [](const QJsonObject&) {
            return QStringLiteral(
                "Summarize the work done in this session. Include the project name, a one-line "
                "task description, completed and pending tasks, modified files and key "
                "decisions, then call the show_summary tool with them.");
        });

    setResourceUpdatedCallback([&server](const QString& uri) { server.notifyResourceUpdated(uri); });
}

void NotchTools::storeChanged()
{
    QMutexLocker lock(&wakeMutex_);
    wake_.wakeAll();
}

void NotchTools::push(const Notification& notification) const
{
    SendResult sent = client_.send(notification);
    if (!sent.delivered || !sent.acknowledged)
        BOOST_LOG_TRIVIAL(warning) << "[NotchTools] Notification '"
                                   << notification.title.toStdString()
                                   << "' not delivered: " << sent.error.toStdString();
}

ToolResult NotchTools::showProgress(const QJsonObject& args)
{
    QString title;
    if (QString e = takeString(args, "title", title); !e.isEmpty())
        return ToolResult::invalidParams(e);

    const QJsonValue rawProgress = args.value("progress");
    if (!rawProgress.isDouble())
        return ToolResult::invalidParams(QStringLiteral("Argument 'progress' must be a number"));
    const double progress = std::clamp(rawProgress.toDouble(), 0.0, 1.0);

    const QJsonValue rawCancellable = args.value("cancellable");
    if (!rawCancellable.isUndefined() && !rawCancellable.isNull() && !rawCancellable.isBool())
        return ToolResult::invalidParams(QStringLiteral("Argument 'cancellable' must be a boolean"));
    const bool cancellable = rawCancellable.toBool(false);

    const int percent = static_cast<int>(progress * 100.0 + 0.5);

    Notification n;
    n.title = title;
    n.message = QStringLiteral("%1%").arg(percent);
    n.kind = NotificationKind::Progress;
    n.priority = Priority::Normal;
    n.metadata.insert(QStringLiteral("progress"), QString::number(progress));
    n.metadata.insert(QStringLiteral("cancellable"), cancellable ? QStringLiteral("true") : QStringLiteral("false"));
    n.metadata.insert(QStringLiteral("source"), QStringLiteral("mcp"));
    push(n);

    return ToolResult::text(QStringLiteral("Progress notification displayed: %1 (%2%)").arg(title).arg(percent));
}

ToolResult NotchTools::showResult(const QJsonObject& args)
{
    QString title, type, message;
    if (QString e = takeString(args, "title", title); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeString(args, "type", type); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeOptionalString(args, "message", message); !e.isEmpty())
        return ToolResult::invalidParams(e);

    Notification n;
    n.title = title;
    n.message = message;
    n.kind = kindFromString(type);
    n.priority = Priority::High;
    n.metadata.insert(QStringLiteral("source"), QStringLiteral("mcp"));
    push(n);

    return ToolResult::text(QStringLiteral("Result notification displayed: ") + title);
}

ToolResult NotchTools::askConfirmation(const QJsonObject& args)
{
    QString question;
    QStringList options;
    if (QString e = takeString(args, "question", question); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "options", options, true); !e.isEmpty())
        return ToolResult::invalidParams(e);

    Notification n;
    n.title = QStringLiteral("Confirmation Required");
    n.message = question;
    n.kind = NotificationKind::Reminder;
    n.priority = Priority::Urgent;
    for (const QString& option : options)
        n.actions.append(NotificationAction{option, option, ActionStyle::Normal});
    n.metadata.insert(QStringLiteral("source"), QStringLiteral("mcp"));
    n.metadata.insert(QStringLiteral("interactive"), QStringLiteral("true"));
    push(n);

    return ToolResult::text(QStringLiteral("Confirmation prompt displayed. User response: pending"));
}

ToolResult NotchTools::showActionableResult(const QJsonObject& args)
{
    QString title, message;
    QString type = QStringLiteral("info");
    QStringList actions;
    if (QString e = takeString(args, "title", title); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeString(args, "message", message); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeOptionalString(args, "type", type); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "actions", actions, true); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (actions.isEmpty() || actions.size() > kMaxActions)
        return ToolResult::invalidParams(
            QStringLiteral("Argument 'actions' must hold 1 to %1 labels").arg(kMaxActions));
    if (std::any_of(actions.cbegin(), actions.cend(), [](const QString& a) { return a.isEmpty(); }))
        return ToolResult::invalidParams(QStringLiteral("Action labels must not be empty"));

    const QString requestId = idGenerator_();
    const NotificationKind kind = kindFromString(type);
    store_->create(requestId, title, message, kindToString(kind), actions);

    Notification n;
    n.title = title;
    n.message = message;
    n.kind = kind;
    n.priority = Priority::Urgent;
    for (const QString& label : actions)
        n.actions.append(NotificationAction{label, makeActionToken(requestId, label), ActionStyle::Normal});
    n.metadata.insert(QStringLiteral("source"), QStringLiteral("mcp"));
    n.metadata.insert(QStringLiteral("interactive"), QStringLiteral("true"));
    n.metadata.insert(QStringLiteral("actionable"), QStringLiteral("true"));
    n.metadata.insert(QStringLiteral("request_id"), requestId);
    push(n);

    BOOST_LOG_TRIVIAL(info) << "[NotchTools] Waiting for choice on " << requestId.toStdString();

    if (auto choice = waitForChoice(requestId)) {
        store_->remove(requestId);
        BOOST_LOG_TRIVIAL(info) << "[NotchTools] " << requestId.toStdString()
                                << " resolved: " << choice->toStdString();
        if (resourceUpdated_ && !storeWatched_)
            resourceUpdated_(QString::fromLatin1(kPendingActionsUri));
        ToolResult r;
        r.result = resolvedResult(requestId, *choice);
        return r;
    }

    store_->remove(requestId);
    BOOST_LOG_TRIVIAL(info) << "[NotchTools] " << requestId.toStdString() << " timed out";
    ToolResult r;
    r.result = timeoutResult(requestId);
    return r;
}

std::optional<QString> NotchTools::waitForChoice(const QString& requestId)
{
    // The deadline is fixed up front so early wake-ups from the watcher never
    // shorten the overall wait.
    const qint64 deadlineMs = static_cast<qint64>(options_.pollIntervalMs) * options_.maxPolls;
    QElapsedTimer elapsed;
    elapsed.start();

    for (;;) {
        const qint64 remaining = deadlineMs - elapsed.elapsed();
        if (remaining <= 0)
            return std::nullopt;
        {
            QMutexLocker lock(&wakeMutex_);
            wake_.wait(&wakeMutex_, static_cast<unsigned long>(
                std::min<qint64>(options_.pollIntervalMs, remaining)));
        }
        if (auto choice = store_->getChoice(requestId))
            return choice;
    }
}

ToolResult NotchTools::showSummary(const QJsonObject& args)
{
    QString projectName, taskDescription, projectPath;
    QStringList completed, pending, modified, decisions;
    if (QString e = takeString(args, "project_name", projectName); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeString(args, "task_description", taskDescription); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeOptionalString(args, "project_path", projectPath); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "completed_tasks", completed, false); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "pending_tasks", pending, false); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "modified_files", modified, false); !e.isEmpty())
        return ToolResult::invalidParams(e);
    if (QString e = takeStringList(args, "key_decisions", decisions, false); !e.isEmpty())
        return ToolResult::invalidParams(e);

    const QString summaryId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QJsonObject summary{
        {"id", summaryId},
        {"project_name", projectName},
        {"task_description", taskDescription},
        {"completed_tasks", QJsonArray::fromStringList(completed)},
        {"pending_tasks", QJsonArray::fromStringList(pending)},
        {"modified_files", QJsonArray::fromStringList(modified)},
        {"key_decisions", QJsonArray::fromStringList(decisions)},
        {"created_at", QDateTime::currentDateTimeUtc().toString(Qt::ISODate)}
    };
    if (!projectPath.isEmpty())
        summary["project_path"] = projectPath;

    Notification n;
    n.title = QStringLiteral("Session summary ready");
    n.message = projectName;
    n.kind = NotificationKind::Success;
    n.priority = Priority::High;
    n.metadata.insert(QStringLiteral("source"), QStringLiteral("mcp"));
    n.metadata.insert(QStringLiteral("summary_id"), summaryId);
    n.metadata.insert(QStringLiteral("summary_data"),
                      QString::fromUtf8(QJsonDocument(summary).toJson(QJsonDocument::Compact)));
    if (!projectPath.isEmpty())
        n.metadata.insert(QStringLiteral("project_path"), projectPath);
    push(n);

    return ToolResult::text(QStringLiteral("Summary for %1 displayed (%2 completed, %3 pending)")
                                .arg(projectName).arg(completed.size()).arg(pending.size()));
}

QByteArray NotchTools::pendingActionsJson() const
{
    QJsonArray list;
    for (const auto& action : store_->listPending())
        list.append(action.toJson());
    return QJsonDocument(list).toJson(QJsonDocument::Compact);
}

} // namespace notch
