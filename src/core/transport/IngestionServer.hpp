#pragma once

#include "core/Notification.hpp"
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <atomic>
#include <functional>
#include <memory>

class QLocalSocket;
class QThread;

namespace notch {

/// Unix domain socket listener that is the only way into the display process.
///
/// One connection carries one JSON envelope; the server answers with a single
/// ack line and closes. The listening QLocalServer lives on a dedicated
/// thread and every connection is served on a pool thread, so the handler is
/// called off the main thread. Callers that touch main-thread objects must
/// hop over with a queued invocation.
class IngestionServer : public QObject {
    Q_OBJECT

public:
    using Handler = std::function<void(const Notification&)>;

    struct Options {
        int backlog = 5;
        int bufferBytes = 64 * 1024;
        int receiveTimeoutMs = 2000;  // whole envelope, not per read
        int sendTimeoutMs = 2000;
    };

    explicit IngestionServer(Handler handler, QObject* parent = nullptr);
    ~IngestionServer() override;

    /// Remove a stale socket file and listen. Returns false (and leaves the
    /// server stopped) if the socket cannot be created.
    bool start(const QString& socketPath, const Options& options = Options());

    /// Stop accepting, let in-flight connections finish, remove the socket file.
    void stop();

    bool isRunning() const { return listener_ != nullptr; }
    QString socketPath() const { return socketPath_; }

    int acceptedCount() const { return accepted_.load(); }
    int rejectedCount() const { return rejected_.load(); }

private:
    class Listener;

    void serveConnection(quintptr descriptor);
    QByteArray readEnvelope(QLocalSocket& socket) const;
    void reply(QLocalSocket& socket, const QByteArray& ack) const;

    Handler handler_;
    Options options_;
    QString socketPath_;
    Listener* listener_ = nullptr;
    std::unique_ptr<QThread> listenThread_;
    QThreadPool pool_;
    std::atomic<int> accepted_{0};
    std::atomic<int> rejected_{0};
};

} // namespace notch
