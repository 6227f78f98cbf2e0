#pragma once

#include "core/store/IPendingActionStore.hpp"
#include <QMap>
#include <QMutex>
#include <chrono>

namespace notch {

/// File-backed IPendingActionStore shared between the display process and
/// any number of tool processes.
///
/// Every operation runs the full cycle under an in-process mutex plus an
/// exclusive flock on lockPath: read the whole JSON map, mutate, write the
/// whole map back. Writes truncate and rewrite the file in place instead of
/// renaming a temp file over it, so the inode stays stable for
/// PendingActionWatcher. A crash mid-write can therefore leave a truncated
/// file; load() treats that as an empty map.
class PendingActionStore : public IPendingActionStore {
public:
    PendingActionStore(const QString& storagePath, const QString& lockPath);

    void create(const QString& id, const QString& title, const QString& message,
                const QString& kind, const QStringList& actions) override;
    void setChoice(const QString& id, const QString& choice) override;
    std::optional<QString> getChoice(const QString& id) const override;
    void remove(const QString& id) override;
    QList<PendingAction> listPending() const override;

    /// Drop records older than maxAge (orphans left by late clicks).
    /// Returns the number removed.
    int sweepStale(std::chrono::seconds maxAge);

    QString storagePath() const { return storagePath_; }
    QString lockPath() const { return lockPath_; }

private:
    using ActionMap = QMap<QString, PendingAction>;

    template <typename Fn>
    auto locked(Fn&& fn) const;

    ActionMap load() const;
    void save(const ActionMap& actions) const;

    QString storagePath_;
    QString lockPath_;
    mutable QMutex mutex_;
};

} // namespace notch
