#pragma once

#include "core/Notification.hpp"
#include <QString>

namespace notch {

struct SendResult {
    bool delivered = false;     // envelope fully written to the socket
    bool acknowledged = false;  // server answered {"success":true}
    QString error;
};

/// Short-lived client for the ingestion socket: one connection per envelope.
class IngestionClient {
public:
    explicit IngestionClient(const QString& socketPath, int timeoutMs = 2000);

    /// Blocking; intended for worker threads and CLI use. Never throws.
    /// With waitForAck false the call returns once the bytes are written.
    SendResult send(const Notification& notification, bool waitForAck = true) const;

    QString socketPath() const { return socketPath_; }

private:
    QString socketPath_;
    int timeoutMs_;
};

} // namespace notch
