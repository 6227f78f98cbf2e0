#pragma once

#include <QByteArray>
#include <QThread>
#include <atomic>

namespace notch {

// Reads newline-delimited input from a file descriptor (stdin for notch-mcp)
// on its own thread. lineReceived is emitted per complete line and delivered
// queued to receivers on other threads; endOfInput fires once at EOF.
class LineReader : public QThread {
    Q_OBJECT

public:
    explicit LineReader(int fd, QObject* parent = nullptr);
    ~LineReader() override;

    void requestStop() { stopRequested_ = true; }

signals:
    void lineReceived(const QByteArray& line);
    void endOfInput();

protected:
    void run() override;

private:
    int fd_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace notch
