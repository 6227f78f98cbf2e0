#include <QtTest>
#include <QElapsedTimer>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QTemporaryDir>
#include <QThread>
#include <atomic>
#include <cstring>
#include <memory>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>
#include "core/NotificationCodec.hpp"
#include "core/transport/IngestionClient.hpp"
#include "core/transport/IngestionServer.hpp"

namespace {

// Plain POSIX client so tests control exactly what goes over the wire.
int connectRaw(const QString& path)
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.toLocal8Bit().constData(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    struct timeval tv{5, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

QByteArray readAllRaw(int fd)
{
    QByteArray out;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0)
        out.append(buf, static_cast<int>(n));
    return out;
}

QByteArray exchange(const QString& path, const QByteArray& payload, bool closeWrite)
{
    int fd = connectRaw(path);
    if (fd < 0) return "connect failed";
    ::send(fd, payload.constData(), payload.size(), MSG_NOSIGNAL);
    if (closeWrite)
        ::shutdown(fd, SHUT_WR);
    QByteArray reply = readAllRaw(fd);
    ::close(fd);
    return reply;
}

notch::Notification sample(const QString& title)
{
    notch::Notification n;
    n.title = title;
    n.message = "body";
    n.kind = notch::NotificationKind::Success;
    return n;
}

} // namespace

class TestIngestionServer : public QObject {
    Q_OBJECT

private:
    QTemporaryDir tmp_;
    QString socketPath() const { return tmp_.filePath("notch.sock"); }

private slots:
    void testStartCreatesAndStopRemovesSocket()
    {
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath()));
        QVERIFY(server.isRunning());
        QVERIFY(QFile::exists(socketPath()));

        server.stop();
        QVERIFY(!server.isRunning());
        QVERIFY(!QFile::exists(socketPath()));
    }

    void testRoundTrip()
    {
        QMutex mutex;
        QList<notch::Notification> received;
        notch::IngestionServer server([&](const notch::Notification& n) {
            QMutexLocker lock(&mutex);
            received.append(n);
        });
        QVERIFY(server.start(socketPath()));

        notch::IngestionClient client(socketPath());
        notch::Notification n = sample("Build finished");
        n.actions.append(notch::NotificationAction{"Open", "open", notch::ActionStyle::Primary});
        n.metadata.insert("source", "test");

        notch::SendResult result = client.send(n);
        QVERIFY2(result.acknowledged, qPrintable(result.error));
        QVERIFY(result.delivered);

        QMutexLocker lock(&mutex);
        QCOMPARE(received.size(), 1);
        QCOMPARE(received[0].title, QString("Build finished"));
        QCOMPARE(received[0].kind, notch::NotificationKind::Success);
        QCOMPARE(received[0].actions.size(), 1);
        QCOMPARE(received[0].metadata.value("source"), QString("test"));
        QCOMPARE(server.acceptedCount(), 1);
        QCOMPARE(server.rejectedCount(), 0);
    }

    void testEnvelopeWithoutNewline()
    {
        std::atomic<int> calls{0};
        notch::IngestionServer server([&](const notch::Notification&) { ++calls; });
        QVERIFY(server.start(socketPath()));

        // Write side stays open: the server must notice the object is complete
        QByteArray reply = exchange(socketPath(), R"({"title":"t","message":"m"})", false);
        QCOMPARE(reply, notch::successAck());
        QCOMPARE(calls.load(), 1);
    }

    void testMalformedJsonGetsErrorAck()
    {
        std::atomic<int> calls{0};
        notch::IngestionServer server([&](const notch::Notification&) { ++calls; });
        QVERIFY(server.start(socketPath()));

        QByteArray reply = exchange(socketPath(), "this is not json\n", false);
        QVERIFY(reply.endsWith('\n'));
        QJsonObject ack = QJsonDocument::fromJson(reply.trimmed()).object();
        QCOMPARE(ack.value("success").toBool(true), false);
        QVERIFY(ack.value("error").toString().startsWith("Invalid JSON"));
        QCOMPARE(calls.load(), 0);
        QCOMPARE(server.rejectedCount(), 1);

        // Listener is unaffected
        notch::SendResult ok = notch::IngestionClient(socketPath()).send(sample("after"));
        QVERIFY(ok.acknowledged);
        QCOMPARE(calls.load(), 1);
    }

    void testMissingFieldGetsErrorAck()
    {
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath()));

        QByteArray reply = exchange(socketPath(), "{\"title\":\"only\"}\n", false);
        QJsonObject ack = QJsonDocument::fromJson(reply.trimmed()).object();
        QCOMPARE(ack.value("success").toBool(true), false);
        QVERIFY(ack.value("error").toString().contains("message"));
    }

    void testEmptyConnectionGetsNoReply()
    {
        std::atomic<int> calls{0};
        notch::IngestionServer server([&](const notch::Notification&) { ++calls; });
        QVERIFY(server.start(socketPath()));

        QCOMPARE(exchange(socketPath(), QByteArray(), true), QByteArray());
        QCOMPARE(calls.load(), 0);
        QCOMPARE(server.acceptedCount(), 0);
        QCOMPARE(server.rejectedCount(), 0);
    }

    void testReceiveTimeoutEndsRead()
    {
        notch::IngestionServer::Options options;
        options.receiveTimeoutMs = 200;
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath(), options));

        // Half an envelope and then silence, with the write side left open
        QElapsedTimer timer;
        timer.start();
        QByteArray reply = exchange(socketPath(), "{\"title\":\"t\",", false);
        QVERIFY(timer.elapsed() < 3000);
        QJsonObject ack = QJsonDocument::fromJson(reply.trimmed()).object();
        QCOMPARE(ack.value("success").toBool(true), false);
    }

    void testTricklingClientHitsOverallDeadline()
    {
        notch::IngestionServer::Options options;
        options.receiveTimeoutMs = 300;
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath(), options));

        // One byte every 50 ms never lets a single read time out
        const QByteArray payload = "{\"title\":\"" + QByteArray(60, 'x');
        int fd = connectRaw(socketPath());
        QVERIFY(fd >= 0);

        QElapsedTimer timer;
        timer.start();
        QByteArray reply;
        for (char c : payload) {
            ::send(fd, &c, 1, MSG_NOSIGNAL);
            QThread::msleep(50);
            char buf[256];
            ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
            if (n > 0) {
                reply.append(buf, static_cast<int>(n));
                break;
            }
        }
        const qint64 elapsed = timer.elapsed();
        reply.append(readAllRaw(fd));
        ::close(fd);

        QVERIFY2(elapsed >= 250 && elapsed < 1500, qPrintable(QString::number(elapsed)));
        QJsonObject ack = QJsonDocument::fromJson(reply.trimmed()).object();
        QCOMPARE(ack.value("success").toBool(true), false);
        QCOMPARE(server.rejectedCount(), 1);
    }

    void testOversizedEnvelopeIsCut()
    {
        notch::IngestionServer::Options options;
        options.bufferBytes = 64;
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath(), options));

        QByteArray big = "{\"title\":\"" + QByteArray(200, 'x') + "\",\"message\":\"m\"}\n";
        QByteArray reply = exchange(socketPath(), big, false);
        QJsonObject ack = QJsonDocument::fromJson(reply.trimmed()).object();
        QCOMPARE(ack.value("success").toBool(true), false);
    }

    void testStaleSocketFileReplaced()
    {
        {
            QFile stale(socketPath());
            QVERIFY(stale.open(QIODevice::WriteOnly));
            stale.write("leftover");
        }
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath()));
        QVERIFY(notch::IngestionClient(socketPath()).send(sample("x")).acknowledged);
    }

    void testBindFailureLeavesServerStopped()
    {
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(!server.start(tmp_.filePath("no/such/dir/notch.sock")));
        QVERIFY(!server.isRunning());
        server.stop();  // harmless
    }

    void testPathTooLongRejected()
    {
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(!server.start("/tmp/" + QString(200, 'a') + ".sock"));
        QVERIFY(!server.isRunning());
    }

    void testStartTwiceFails()
    {
        notch::IngestionServer server([](const notch::Notification&) {});
        QVERIFY(server.start(socketPath()));
        QVERIFY(!server.start(socketPath()));
        QVERIFY(server.isRunning());
    }

    void testConcurrentClients()
    {
        std::atomic<int> calls{0};
        notch::IngestionServer server([&](const notch::Notification&) {
            QThread::msleep(20);  // hold pool threads so connections overlap
            ++calls;
        });
        QVERIFY(server.start(socketPath()));

        constexpr int kClients = 20;
        std::atomic<int> acked{0};
        std::vector<std::unique_ptr<QThread>> threads;
        for (int i = 0; i < kClients; ++i) {
            threads.emplace_back(QThread::create([this, &acked, i] {
                notch::IngestionClient client(socketPath(), 5000);
                if (client.send(sample(QString("n%1").arg(i))).acknowledged)
                    ++acked;
            }));
            threads.back()->start();
        }
        for (auto& t : threads)
            QVERIFY(t->wait(10000));

        QCOMPARE(acked.load(), kClients);
        QCOMPARE(calls.load(), kClients);
        QCOMPARE(server.acceptedCount(), kClients);
    }
};

QTEST_MAIN(TestIngestionServer)
#include "test_ingestion_server.moc"
