#include "core/store/FileLock.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace notch {

FileLock::FileLock(const QString& lockPath)
{
    const QByteArray path = lockPath.toLocal8Bit();
    fd_ = ::open(path.constData(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[FileLock] Cannot open " << path.constData()
                                   << ": " << strerror(errno)
                                   << " (continuing unlocked, unsafe)";
        return;
    }

    int ret;
    do {
        ret = ::flock(fd_, LOCK_EX);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[FileLock] flock failed on " << path.constData()
                                   << ": " << strerror(errno)
                                   << " (continuing unlocked, unsafe)";
        return;
    }
    locked_ = true;
}

FileLock::~FileLock()
{
    if (fd_ < 0) return;
    if (locked_)
        ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

} // namespace notch
