#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include <atomic>
#include "core/store/PendingActionStore.hpp"
#include "core/store/PendingActionWatcher.hpp"

class TestPendingActionWatcher : public QObject {
    Q_OBJECT
private slots:
    void testCreatesPlaceholder()
    {
        QTemporaryDir tmp;
        const QString path = tmp.filePath("pending.json");
        QVERIFY(!QFile::exists(path));

        notch::PendingActionWatcher watcher(path, [] {});
        QVERIFY(watcher.watch());

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        QCOMPARE(f.readAll(), QByteArray("{}"));
        watcher.stop();
    }

    void testExistingFileUntouched()
    {
        QTemporaryDir tmp;
        const QString path = tmp.filePath("pending.json");
        {
            QFile f(path);
            QVERIFY(f.open(QIODevice::WriteOnly));
            f.write("{\"keep\":1}");
        }

        notch::PendingActionWatcher watcher(path, [] {});
        QVERIFY(watcher.watch());
        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        QCOMPARE(f.readAll(), QByteArray("{\"keep\":1}"));
    }

    void testCallbackOnStoreWrite()
    {
        QTemporaryDir tmp;
        const QString path = tmp.filePath("pending.json");
        std::atomic<int> calls{0};

        notch::PendingActionWatcher watcher(path, [&calls] { ++calls; });
        QVERIFY(watcher.watch());
        QVERIFY(watcher.isRunning());

        notch::PendingActionStore store(path, tmp.filePath("pending.lock"));
        store.create("abc", "T", "M", "info", {"Yes"});
        QTRY_VERIFY_WITH_TIMEOUT(calls.load() > 0, 2000);

        const int before = calls.load();
        store.setChoice("abc", "Yes");
        QTRY_VERIFY_WITH_TIMEOUT(calls.load() > before, 2000);
    }

    void testReadsDoNotTrigger()
    {
        QTemporaryDir tmp;
        const QString path = tmp.filePath("pending.json");
        std::atomic<int> calls{0};

        notch::PendingActionWatcher watcher(path, [&calls] { ++calls; });
        QVERIFY(watcher.watch());

        notch::PendingActionStore store(path, tmp.filePath("pending.lock"));
        QVERIFY(store.listPending().isEmpty());
        QVERIFY(!store.getChoice("abc").has_value());
        QTest::qWait(300);
        QCOMPARE(calls.load(), 0);
    }

    void testRearmsAfterDelete()
    {
        QTemporaryDir tmp;
        const QString path = tmp.filePath("pending.json");
        std::atomic<int> calls{0};

        notch::PendingActionWatcher watcher(path, [&calls] { ++calls; });
        QVERIFY(watcher.watch());

        QVERIFY(QFile::remove(path));
        QTRY_VERIFY_WITH_TIMEOUT(calls.load() > 0, 2000);

        // The placeholder comes back and the new inode is watched
        QTRY_VERIFY_WITH_TIMEOUT(QFile::exists(path), 2000);
        QTest::qWait(200);

        const int before = calls.load();
        notch::PendingActionStore store(path, tmp.filePath("pending.lock"));
        store.create("abc", "T", "M", "info", {"Yes"});
        QTRY_VERIFY_WITH_TIMEOUT(calls.load() > before, 2000);
    }

    void testStopEndsThread()
    {
        QTemporaryDir tmp;
        std::atomic<int> calls{0};
        notch::PendingActionWatcher watcher(tmp.filePath("pending.json"), [&calls] { ++calls; });
        QVERIFY(watcher.watch());
        watcher.stop();
        QVERIFY(!watcher.isRunning());

        notch::PendingActionStore store(tmp.filePath("pending.json"), tmp.filePath("pending.lock"));
        store.create("abc", "T", "M", "info", {"Yes"});
        QTest::qWait(300);
        QCOMPARE(calls.load(), 0);
    }

    void testWatchFailsForUncreatablePath()
    {
        notch::PendingActionWatcher watcher("/proc/notch-nonexistent/pending.json", [] {});
        QVERIFY(!watcher.watch());
        QVERIFY(!watcher.isRunning());
    }
};

QTEST_MAIN(TestPendingActionWatcher)
#include "test_pending_action_watcher.moc"
