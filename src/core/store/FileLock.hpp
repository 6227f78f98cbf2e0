#pragma once

#include <QString>

namespace notch {

/// Scoped exclusive flock(2) on a lock file. Blocks in the constructor until
/// the lock is held. If the lock file cannot be opened the guard is inert
/// (isLocked() == false) and the caller proceeds without cross-process
/// exclusion; the condition is logged.
class FileLock {
public:
    explicit FileLock(const QString& lockPath);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool isLocked() const { return locked_; }

private:
    int fd_ = -1;
    bool locked_ = false;
};

} // namespace notch
