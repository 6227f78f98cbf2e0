#include "core/transport/IngestionServer.hpp"
#include "core/NotificationCodec.hpp"
#include <QElapsedTimer>
#include <QFile>
#include <QJsonDocument>
#include <QLocalServer>
#include <QLocalSocket>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <unistd.h>

namespace notch {

// Accepts on the listen thread and hands each descriptor to the pool.
class IngestionServer::Listener : public QLocalServer {
public:
    explicit Listener(IngestionServer* owner) : owner_(owner) {}

protected:
    void incomingConnection(quintptr descriptor) override
    {
        IngestionServer* owner = owner_;
        owner->pool_.start([owner, descriptor] { owner->serveConnection(descriptor); });
    }

private:
    IngestionServer* owner_;
};

namespace {

// An envelope is complete at the first newline, or as soon as the bytes so
// far already form a JSON object (clients are not required to terminate).
bool envelopeComplete(const QByteArray& buffer)
{
    if (buffer.contains('\n'))
        return true;
    QJsonParseError err;
    QJsonDocument::fromJson(buffer, &err);
    return err.error == QJsonParseError::NoError;
}

} // namespace

IngestionServer::IngestionServer(Handler handler, QObject* parent)
    : QObject(parent)
    , handler_(std::move(handler))
{
}

IngestionServer::~IngestionServer()
{
    stop();
}

bool IngestionServer::start(const QString& socketPath, const Options& options)
{
    if (listener_)
        return false;

    // A previous instance that crashed leaves its socket file behind
    QFile::remove(socketPath);

    options_ = options;

    auto thread = std::make_unique<QThread>();
    thread->setObjectName(QStringLiteral("IngestionListen"));
    auto* listener = new Listener(this);
    listener->setListenBacklogSize(options.backlog);
    listener->moveToThread(thread.get());
    connect(thread.get(), &QThread::finished, listener, &QObject::deleteLater);
    thread->start();

    bool listening = false;
    QString error;
    QMetaObject::invokeMethod(listener, [&] {
        listening = listener->listen(socketPath);
        if (!listening)
            error = listener->errorString();
    }, Qt::BlockingQueuedConnection);

    if (!listening) {
        BOOST_LOG_TRIVIAL(error) << "[IngestionServer] Cannot listen on "
                                 << socketPath.toStdString() << ": " << error.toStdString();
        thread->quit();
        thread->wait();
        return false;
    }

    socketPath_ = socketPath;
    listener_ = listener;
    listenThread_ = std::move(thread);

    BOOST_LOG_TRIVIAL(info) << "[IngestionServer] Listening on " << socketPath.toStdString();
    return true;
}

void IngestionServer::stop()
{
    if (!listener_)
        return;

    // close() removes the socket file; the listener is deleted when its thread ends
    Listener* listener = listener_;
    QMetaObject::invokeMethod(listener, [listener] { listener->close(); },
                              Qt::BlockingQueuedConnection);
    listener_ = nullptr;

    listenThread_->quit();
    listenThread_->wait();
    listenThread_.reset();

    pool_.waitForDone();

    BOOST_LOG_TRIVIAL(info) << "[IngestionServer] Stopped (" << accepted_.load()
                            << " accepted, " << rejected_.load() << " rejected)";
}

QByteArray IngestionServer::readEnvelope(QLocalSocket& socket) const
{
    QByteArray buffer;
    QElapsedTimer elapsed;
    elapsed.start();

    while (buffer.size() < options_.bufferBytes) {
        if (socket.bytesAvailable() == 0) {
            const qint64 remaining = options_.receiveTimeoutMs - elapsed.elapsed();
            if (remaining <= 0) {
                BOOST_LOG_TRIVIAL(debug) << "[IngestionServer] Receive deadline reached after "
                                         << buffer.size() << " bytes";
                break;
            }
            if (!socket.waitForReadyRead(static_cast<int>(remaining)))
                break;  // timeout, EOF or error ends the read with whatever arrived
        }
        buffer.append(socket.read(options_.bufferBytes - buffer.size()));
        if (envelopeComplete(buffer))
            break;
    }
    return buffer;
}

void IngestionServer::reply(QLocalSocket& socket, const QByteArray& ack) const
{
    socket.write(ack);
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(options_.sendTimeoutMs)) {
            BOOST_LOG_TRIVIAL(warning) << "[IngestionServer] Ack not sent: "
                                       << socket.errorString().toStdString();
            return;
        }
    }
}

void IngestionServer::serveConnection(quintptr descriptor)
{
    QLocalSocket socket;
    if (!socket.setSocketDescriptor(descriptor)) {
        BOOST_LOG_TRIVIAL(warning) << "[IngestionServer] Cannot adopt connection: "
                                   << socket.errorString().toStdString();
        ::close(static_cast<int>(descriptor));
        return;
    }

    const QByteArray data = readEnvelope(socket);
    if (data.trimmed().isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "[IngestionServer] Empty request, closing";
        return;
    }

    DecodeResult decoded = decodeNotification(data);
    if (!decoded.ok()) {
        ++rejected_;
        BOOST_LOG_TRIVIAL(warning) << "[IngestionServer] Rejected envelope: "
                                   << decoded.error.toStdString();
        reply(socket, errorAck(decoded.error));
        socket.disconnectFromServer();
        return;
    }

    ++accepted_;
    BOOST_LOG_TRIVIAL(debug) << "[IngestionServer] Received '"
                             << decoded.notification->title.toStdString() << "'";
    if (handler_)
        handler_(*decoded.notification);
    reply(socket, successAck());
    socket.disconnectFromServer();
}

} // namespace notch
