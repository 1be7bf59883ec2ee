#pragma once
#include <string>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>
#endif

namespace guardrail {

// ── RAII exclusive lock on <path>.lock ──────────────────────────────
//
// Held for the whole scope; released on every exit path including
// exceptions. The lock file itself is left in place so that concurrent
// invocations always contend on the same inode.

class FileLock {
public:
    explicit FileLock(const std::string& path) : path_(path + ".lock") {
#ifdef _WIN32
        for (int i = 0; i < 200; ++i) {
            handle_ = CreateFileA(path_.c_str(), GENERIC_WRITE, 0, nullptr,
                                  OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
            if (handle_ != INVALID_HANDLE_VALUE) break;
            Sleep(10);
        }
        locked_ = handle_ != INVALID_HANDLE_VALUE;
#else
        fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR, 0644);
        if (fd_ >= 0) locked_ = ::flock(fd_, LOCK_EX) == 0;
#endif
    }
    ~FileLock() {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
#else
        if (fd_ >= 0) { ::flock(fd_, LOCK_UN); ::close(fd_); }
#endif
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    std::string path_;
    bool locked_ = false;
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

} // namespace guardrail
