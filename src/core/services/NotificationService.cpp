#include "NotificationService.hpp"
#include "core/NotificationCodec.hpp"
#include "core/store/IPendingActionStore.hpp"
#include <QTimer>
#include <QUuid>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace notch {

NotificationService::NotificationService(IPendingActionStore* store, QObject* parent)
    : QObject(parent), store_(store)
{
}

int NotificationService::ttlFor(const Notification& n)
{
    if (isActionable(n))
        return 0;

    switch (n.priority) {
    case Priority::Low:    return 3000;
    case Priority::Normal: return 5000;
    case Priority::High:   return 8000;
    case Priority::Urgent: return 0;
    }
    return 5000;
}

QString NotificationService::post(const Notification& notification)
{
    Notification n = notification;
    n.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (!n.timestamp.isValid())
        n.timestamp = QDateTime::currentDateTimeUtc();

    notifications_.append(n);
    emit notificationAdded(n);

    const int ttlMs = ttlFor(n);
    if (ttlMs > 0) {
        QString id = n.id;
        QTimer::singleShot(ttlMs, this, [this, id]() { dismiss(id); });
    }

    return n.id;
}

void NotificationService::dismiss(const QString& notificationId)
{
    for (int i = 0; i < notifications_.size(); ++i) {
        if (notifications_[i].id == notificationId) {
            notifications_.removeAt(i);
            emit notificationRemoved(notificationId);
            return;
        }
    }
}

bool NotificationService::activateAction(const QString& notificationId, const QString& actionToken)
{
    auto it = std::find_if(notifications_.cbegin(), notifications_.cend(),
                           [&](const Notification& n) { return n.id == notificationId; });
    if (it == notifications_.cend()) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] Tap on inactive notification "
                                 << notificationId.toStdString();
        return false;
    }

    auto token = parseActionToken(actionToken);
    if (!token) {
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Action '" << actionToken.toStdString()
                                << "' on " << notificationId.toStdString();
        dismiss(notificationId);
        return true;
    }

    if (store_)
        store_->setChoice(token->requestId, token->label);
    else
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] No store, dropping choice for "
                                   << token->requestId.toStdString();

    dismiss(notificationId);
    emit actionActivated(token->requestId, token->label);
    return true;
}

} // namespace notch
