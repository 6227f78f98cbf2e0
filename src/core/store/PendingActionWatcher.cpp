#include "core/store/PendingActionWatcher.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace notch {

namespace {

constexpr uint32_t kWatchMask = IN_MODIFY | IN_CLOSE_WRITE | IN_MOVE_SELF | IN_DELETE_SELF;
constexpr int kPollTimeoutMs = 100;

} // namespace

PendingActionWatcher::PendingActionWatcher(const QString& path, Callback onChange, QObject* parent)
    : QThread(parent)
    , path_(path)
    , onChange_(std::move(onChange))
{
}

PendingActionWatcher::~PendingActionWatcher()
{
    stop();
}

bool PendingActionWatcher::ensureFileExists() const
{
    if (QFile::exists(path_))
        return true;

    QDir().mkpath(QFileInfo(path_).absolutePath());
    QFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly))
        return QFile::exists(path_);  // lost a creation race, which is fine
    file.write("{}");
    return true;
}

bool PendingActionWatcher::arm()
{
    if (!ensureFileExists())
        return false;
    watchFd_ = ::inotify_add_watch(inotifyFd_, path_.toLocal8Bit().constData(), kWatchMask);
    return watchFd_ >= 0;
}

void PendingActionWatcher::disarm()
{
    if (watchFd_ >= 0) {
        ::inotify_rm_watch(inotifyFd_, watchFd_);
        watchFd_ = -1;
    }
}

bool PendingActionWatcher::watch()
{
    if (isRunning())
        return true;

    inotifyFd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        BOOST_LOG_TRIVIAL(error) << "[PendingActionWatcher] inotify_init1 failed: "
                                 << strerror(errno);
        return false;
    }

    if (!arm()) {
        BOOST_LOG_TRIVIAL(error) << "[PendingActionWatcher] Cannot watch "
                                 << path_.toStdString() << ": " << strerror(errno);
        ::close(inotifyFd_);
        inotifyFd_ = -1;
        return false;
    }

    stopRequested_ = false;
    start();
    BOOST_LOG_TRIVIAL(debug) << "[PendingActionWatcher] Watching " << path_.toStdString();
    return true;
}

void PendingActionWatcher::stop()
{
    stopRequested_ = true;
    if (isRunning())
        wait();

    if (inotifyFd_ >= 0) {
        disarm();
        ::close(inotifyFd_);
        inotifyFd_ = -1;
    }
}

void PendingActionWatcher::run()
{
    alignas(struct inotify_event) char buf[4096];

    struct pollfd pfd;
    pfd.fd = inotifyFd_;
    pfd.events = POLLIN;

    while (!stopRequested_) {
        if (watchFd_ < 0 && arm())
            BOOST_LOG_TRIVIAL(info) << "[PendingActionWatcher] Re-armed on " << path_.toStdString();

        int ret = ::poll(&pfd, 1, kPollTimeoutMs);  // timeout doubles as stop check
        if (ret <= 0) continue;

        ssize_t n = ::read(inotifyFd_, buf, sizeof(buf));
        if (n <= 0) continue;

        bool changed = false;
        for (char* p = buf; p < buf + n;) {
            auto* ev = reinterpret_cast<struct inotify_event*>(p);
            if (ev->mask & kWatchMask)
                changed = true;
            if (ev->wd == watchFd_) {
                if (ev->mask & IN_MOVE_SELF)
                    disarm();      // still on the old inode; follow the path instead
                else if (ev->mask & IN_IGNORED)
                    watchFd_ = -1; // kernel already dropped it
            }
            p += sizeof(struct inotify_event) + ev->len;
        }

        if (changed && onChange_)
            onChange_();
    }
}

} // namespace notch
