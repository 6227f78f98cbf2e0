#include "core/mcp/LineReader.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace notch {

LineReader::LineReader(int fd, QObject* parent)
    : QThread(parent), fd_(fd)
{
}

LineReader::~LineReader()
{
    requestStop();
    wait();
}

void LineReader::run()
{
    QByteArray pending;
    char buf[4096];

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;

    while (!stopRequested_) {
        int ret = ::poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            BOOST_LOG_TRIVIAL(error) << "[LineReader] poll() failed: " << strerror(errno);
            break;
        }
        if (ret == 0) continue;

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            BOOST_LOG_TRIVIAL(error) << "[LineReader] read() failed: " << strerror(errno);
            break;
        }
        if (n == 0)
            break;

        pending.append(buf, static_cast<int>(n));
        int nl;
        while ((nl = pending.indexOf('\n')) >= 0) {
            QByteArray line = pending.left(nl);
            pending.remove(0, nl + 1);
            if (!line.trimmed().isEmpty())
                emit lineReceived(line);
        }
    }

    // Unterminated last line still counts
    if (!pending.trimmed().isEmpty())
        emit lineReceived(pending);
    emit endOfInput();
}

} // namespace notch
