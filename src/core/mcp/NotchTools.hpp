#pragma once

#include "core/mcp/ToolRegistry.hpp"
#include "core/transport/IngestionClient.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <atomic>
#include <functional>
#include <optional>

namespace notch {

class IPendingActionStore;
class McpServer;

/// The notch-mcp tool set: pushes notifications into the display process and
/// runs the blocking actionable round trip through the pending-action store.
class NotchTools {
public:
    static constexpr const char* kPendingActionsUri = "notch://actions/pending";
    static constexpr int kMaxActions = 3;

    struct Options {
        int pollIntervalMs = 1000;
        int maxPolls = 50;
    };

    using IdGenerator = std::function<QString()>;
    using UpdateCallback = std::function<void(const QString& uri)>;

    NotchTools(IPendingActionStore* store, const IngestionClient& client, const Options& options);

    /// Register tools, resources and the work_summary prompt, and route
    /// resource-updated notifications through server.
    void install(ToolRegistry& registry, McpServer& server);

    void setIdGenerator(IdGenerator generator) { idGenerator_ = std::move(generator); }
    void setResourceUpdatedCallback(UpdateCallback callback) { resourceUpdated_ = std::move(callback); }

    /// A store watcher already reports every store write as a resource
    /// update, so resolved calls stop sending their own.
    void setStoreWatched(bool watched) { storeWatched_ = watched; }

    /// The store file changed; wakes waiting actionable calls early.
    /// Called from the watcher thread.
    void storeChanged();

    ToolResult showProgress(const QJsonObject& args);
    ToolResult showResult(const QJsonObject& args);
    ToolResult askConfirmation(const QJsonObject& args);
    ToolResult showActionableResult(const QJsonObject& args);
    ToolResult showSummary(const QJsonObject& args);

    QByteArray pendingActionsJson() const;

private:
    void push(const Notification& notification) const;
    std::optional<QString> waitForChoice(const QString& requestId);

    IPendingActionStore* store_;
    IngestionClient client_;
    Options options_;
    IdGenerator idGenerator_;
    UpdateCallback resourceUpdated_;
    std::atomic<bool> storeWatched_{false};

    QMutex wakeMutex_;
    QWaitCondition wake_;
};

} // namespace notch
