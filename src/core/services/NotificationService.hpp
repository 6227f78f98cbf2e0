#pragma once

#include "INotificationService.hpp"
#include <QList>
#include <QObject>

namespace notch {

class IPendingActionStore;

/// In-memory list of notifications shown by the display process.
/// Main thread only.
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    /// store may be null, in which case actionable taps are only dismissed.
    explicit NotificationService(IPendingActionStore* store, QObject* parent = nullptr);

    QString post(const Notification& notification) override;
    void dismiss(const QString& notificationId) override;
    bool activateAction(const QString& notificationId, const QString& actionToken) override;

    QList<Notification> active() const { return notifications_; }

    /// Auto-dismiss delay in ms, 0 for notifications that stay until handled.
    static int ttlFor(const Notification& notification);

signals:
    void notificationAdded(const notch::Notification& n);
    void notificationRemoved(const QString& id);
    void actionActivated(const QString& requestId, const QString& label);

private:
    IPendingActionStore* store_ = nullptr;
    QList<Notification> notifications_;
};

} // namespace notch
