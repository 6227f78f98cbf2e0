#pragma once

#include <QString>
#include <QThread>
#include <atomic>
#include <functional>

namespace notch {

// Watches the pending-action store file with inotify and calls onChange on
// this thread whenever it is written, renamed or deleted. Events from one
// read() are coalesced into a single callback.
//
// The store rewrites its file in place, so a single watch on the inode is
// enough in practice. If the watch is dropped anyway (file deleted or moved
// away) the thread re-arms on the path, recreating an empty "{}" placeholder
// when nothing is there.
class PendingActionWatcher : public QThread {
    Q_OBJECT

public:
    using Callback = std::function<void()>;

    PendingActionWatcher(const QString& path, Callback onChange, QObject* parent = nullptr);
    ~PendingActionWatcher() override;

    /// Create the placeholder if needed, set up inotify and start the thread.
    bool watch();
    void stop();

    QString path() const { return path_; }

protected:
    void run() override;

private:
    bool ensureFileExists() const;
    bool arm();
    void disarm();

    QString path_;
    Callback onChange_;
    int inotifyFd_ = -1;
    int watchFd_ = -1;
    std::atomic<bool> stopRequested_{false};
};

} // namespace notch
