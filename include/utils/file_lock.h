#pragma once

#include <filesystem>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fakehub {

// Advisory flock(2) on an existing file, best-effort and non-blocking.
// Shared locks open the file read-only, so read-only config files can still
// be locked. locked() reports whether the lock was obtained.
class FileLock {
public:
    enum class Mode { Shared, Exclusive };

    explicit FileLock(const std::filesystem::path& target, Mode mode = Mode::Shared) { acquire(target, mode); }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    void acquire(const std::filesystem::path& target, Mode mode);
    void release();

    int fd_{-1};
    bool locked_{false};
};

inline void FileLock::acquire(const std::filesystem::path& target, Mode mode) {
    const int flags = mode == Mode::Shared ? O_RDONLY : O_RDWR;
    fd_ = ::open(target.c_str(), flags | O_CLOEXEC);
    if (fd_ < 0) return;
    const int op = (mode == Mode::Shared ? LOCK_SH : LOCK_EX) | LOCK_NB;
    if (::flock(fd_, op) == 0) {
        locked_ = true;
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

inline void FileLock::release() {
    if (fd_ < 0) return;
    if (locked_) ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

}  // namespace fakehub
