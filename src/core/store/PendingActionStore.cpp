#include "core/store/PendingActionStore.hpp"
#include "core/store/FileLock.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace notch {

PendingActionStore::PendingActionStore(const QString& storagePath, const QString& lockPath)
    : storagePath_(storagePath), lockPath_(lockPath)
{
}

template <typename Fn>
auto PendingActionStore::locked(Fn&& fn) const
{
    QMutexLocker guard(&mutex_);
    FileLock lock(lockPath_);
    return fn();
}

PendingActionStore::ActionMap PendingActionStore::load() const
{
    ActionMap actions;

    QFile file(storagePath_);
    if (!file.exists())
        return actions;
    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[PendingActionStore] Cannot read "
                                   << storagePath_.toStdString() << ": "
                                   << file.errorString().toStdString();
        return actions;
    }

    const QByteArray data = file.readAll();
    if (data.trimmed().isEmpty())
        return actions;

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[PendingActionStore] Ignoring unreadable store "
                                   << storagePath_.toStdString() << ": "
                                   << err.errorString().toStdString();
        return actions;
    }

    const QJsonObject obj = doc.object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        auto action = PendingAction::fromJson(it.value().toObject());
        if (!action) {
            BOOST_LOG_TRIVIAL(warning) << "[PendingActionStore] Skipping malformed record '"
                                       << it.key().toStdString() << "'";
            continue;
        }
        actions.insert(it.key(), *action);
    }
    return actions;
}

void PendingActionStore::save(const ActionMap& actions) const
{
    QJsonObject obj;
    for (auto it = actions.constBegin(); it != actions.constEnd(); ++it)
        obj[it.key()] = it.value().toJson();

    QDir().mkpath(QFileInfo(storagePath_).absolutePath());

    // In place, not write-and-rename: the watcher holds the inode
    QFile file(storagePath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        BOOST_LOG_TRIVIAL(error) << "[PendingActionStore] Cannot write "
                                 << storagePath_.toStdString() << ": "
                                 << file.errorString().toStdString();
        return;
    }
    const QByteArray data = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size() || !file.flush()) {
        BOOST_LOG_TRIVIAL(error) << "[PendingActionStore] Short write to "
                                 << storagePath_.toStdString() << ": "
                                 << file.errorString().toStdString();
    }
}

void PendingActionStore::create(const QString& id, const QString& title, const QString& message,
                                const QString& kind, const QStringList& actions)
{
    locked([&] {
        ActionMap pending = load();
        PendingAction a;
        a.id = id;
        a.title = title;
        a.message = message;
        a.kind = kind;
        a.actions = actions;
        a.timestamp = QDateTime::currentDateTimeUtc();
        pending.insert(id, a);
        save(pending);
    });
    BOOST_LOG_TRIVIAL(debug) << "[PendingActionStore] Created " << id.toStdString();
}

void PendingActionStore::setChoice(const QString& id, const QString& choice)
{
    bool placeholder = false;
    bool alreadyResolved = false;
    locked([&] {
        ActionMap pending = load();
        auto it = pending.find(id);
        if (it != pending.end() && it->userChoice) {
            // First choice wins; a second tap must not flip the answer
            alreadyResolved = true;
            return;
        }
        if (it == pending.end()) {
            PendingAction a;
            a.id = id;
            a.kind = QStringLiteral("info");
            a.actions = QStringList{choice};
            a.timestamp = QDateTime::currentDateTimeUtc();
            it = pending.insert(id, a);
            placeholder = true;
        }
        it->userChoice = choice;
        save(pending);
    });

    if (alreadyResolved)
        BOOST_LOG_TRIVIAL(debug) << "[PendingActionStore] " << id.toStdString()
                                 << " already resolved, ignoring '" << choice.toStdString() << "'";
    else if (placeholder)
        BOOST_LOG_TRIVIAL(info) << "[PendingActionStore] Choice for unknown id "
                                << id.toStdString() << " stored as placeholder";
    else
        BOOST_LOG_TRIVIAL(debug) << "[PendingActionStore] Choice for " << id.toStdString()
                                 << ": " << choice.toStdString();
}

std::optional<QString> PendingActionStore::getChoice(const QString& id) const
{
    return locked([&]() -> std::optional<QString> {
        const ActionMap pending = load();
        auto it = pending.constFind(id);
        if (it == pending.constEnd())
            return std::nullopt;
        return it->userChoice;
    });
}

void PendingActionStore::remove(const QString& id)
{
    locked([&] {
        ActionMap pending = load();
        if (pending.remove(id) > 0)
            save(pending);
    });
}

QList<PendingAction> PendingActionStore::listPending() const
{
    QList<PendingAction> list = locked([&] { return load().values(); });
    std::sort(list.begin(), list.end(), [](const PendingAction& a, const PendingAction& b) {
        if (a.timestamp != b.timestamp)
            return a.timestamp > b.timestamp;
        return a.id < b.id;
    });
    return list;
}

int PendingActionStore::sweepStale(std::chrono::seconds maxAge)
{
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addSecs(-maxAge.count());
    int removed = locked([&] {
        ActionMap pending = load();
        int count = 0;
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->timestamp < cutoff) {
                it = pending.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        if (count > 0)
            save(pending);
        return count;
    });

    if (removed > 0)
        BOOST_LOG_TRIVIAL(info) << "[PendingActionStore] Swept " << removed << " stale record(s)";
    return removed;
}

} // namespace notch
