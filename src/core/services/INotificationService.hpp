#pragma once

#include "core/Notification.hpp"
#include <QString>

namespace notch {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Post a notification. Assigns and returns a fresh id; any id already
    /// set on the argument is replaced.
    virtual QString post(const Notification& notification) = 0;

    /// Dismiss a notification by ID. Unknown ids are ignored.
    virtual void dismiss(const QString& notificationId) = 0;

    /// The user tapped a button. actionToken is the button's opaque action
    /// string. Returns false when the notification is not active.
    virtual bool activateAction(const QString& notificationId, const QString& actionToken) = 0;
};

} // namespace notch
