#pragma once

#include "core/store/PendingAction.hpp"
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

namespace notch {

class IPendingActionStore {
public:
    virtual ~IPendingActionStore() = default;

    /// Create or replace the record for id (last write wins).
    virtual void create(const QString& id, const QString& title, const QString& message,
                        const QString& kind, const QStringList& actions) = 0;

    /// Record the user's choice. Unknown ids get a placeholder record with the
    /// choice pre-filled, since the resolver can race ahead of the creator.
    /// Ignored when the record already holds a choice.
    virtual void setChoice(const QString& id, const QString& choice) = 0;

    /// Absent when the record does not exist or is still unresolved.
    virtual std::optional<QString> getChoice(const QString& id) const = 0;

    /// No-op for unknown ids.
    virtual void remove(const QString& id) = 0;

    /// Newest first.
    virtual QList<PendingAction> listPending() const = 0;
};

} // namespace notch
