#include "core/transport/IngestionClient.hpp"
#include "core/NotificationCodec.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <boost/log/trivial.hpp>

namespace notch {

IngestionClient::IngestionClient(const QString& socketPath, int timeoutMs)
    : socketPath_(socketPath), timeoutMs_(timeoutMs)
{
}

SendResult IngestionClient::send(const Notification& notification, bool waitForAck) const
{
    SendResult result;

    QLocalSocket socket;
    socket.connectToServer(socketPath_);
    if (!socket.waitForConnected(timeoutMs_)) {
        result.error = QStringLiteral("Cannot connect to %1: %2")
                           .arg(socketPath_, socket.errorString());
        BOOST_LOG_TRIVIAL(warning) << "[IngestionClient] " << result.error.toStdString();
        return result;
    }

    const QByteArray payload = encodeNotification(notification) + '\n';
    socket.write(payload);
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(timeoutMs_)) {
            result.error = QStringLiteral("Write failed: ") + socket.errorString();
            BOOST_LOG_TRIVIAL(warning) << "[IngestionClient] " << result.error.toStdString();
            return result;
        }
    }
    result.delivered = true;

    if (!waitForAck) {
        socket.disconnectFromServer();
        return result;
    }

    while (!socket.canReadLine()) {
        if (!socket.waitForReadyRead(timeoutMs_)) {
            // Server closed without a newline; take whatever is buffered
            if (socket.bytesAvailable() > 0)
                break;
            result.error = QStringLiteral("No acknowledgement: ") + socket.errorString();
            BOOST_LOG_TRIVIAL(warning) << "[IngestionClient] " << result.error.toStdString();
            return result;
        }
    }

    const QByteArray line = socket.canReadLine() ? socket.readLine() : socket.readAll();
    socket.disconnectFromServer();

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = QStringLiteral("Malformed acknowledgement");
        BOOST_LOG_TRIVIAL(warning) << "[IngestionClient] " << result.error.toStdString()
                                   << ": " << line.trimmed().constData();
        return result;
    }

    const QJsonObject ack = doc.object();
    result.acknowledged = ack.value("success").toBool(false);
    if (!result.acknowledged)
        result.error = ack.value("error").toString(QStringLiteral("Rejected"));
    return result;
}

} // namespace notch
