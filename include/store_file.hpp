#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace confshield {

// Owns a POSIX file descriptor. close() reports errors; the destructor
// closes silently.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() noexcept;

    // Throws std::system_error if close(2) fails.
    void close(const std::string& what);

private:
    int fd_ = -1;
};

// Exclusive advisory lock (flock) on a sidecar lock file next to the store.
// Held for a whole sanitize or restore pass and released on destruction,
// including during stack unwinding. The kernel drops it if the process dies.
class StoreLock {
public:
    /**
     * @param lock_path Lock file, created with mode 0600 if missing.
     * @param timeout Zero fails immediately when another process holds the
     *        lock; otherwise polls until the timeout expires.
     * @throws StoreLockedError if the lock could not be taken in time.
     */
    static StoreLock acquire(const std::filesystem::path& lock_path,
                             std::chrono::milliseconds timeout);

    StoreLock(StoreLock&&) noexcept = default;
    StoreLock& operator=(StoreLock&&) noexcept = default;
    ~StoreLock();

    const std::filesystem::path& path() const { return path_; }

private:
    StoreLock(FileDescriptor fd, std::filesystem::path path)
        : fd_(std::move(fd)), path_(std::move(path)) {}

    FileDescriptor fd_;
    std::filesystem::path path_;
};

// Reads a whole file. Throws StoreNotFoundError if it does not exist and
// std::system_error on any other I/O failure.
std::vector<unsigned char> read_file(const std::filesystem::path& path);

// Replaces `path` with `data` (mode 0600) through a temp file in the same
// directory: write, fsync, rename, fsync directory. On failure the previous
// file is left untouched and the temp file is removed.
void write_file_atomic(const std::filesystem::path& path, const std::vector<unsigned char>& data);

// Creates `path` exclusively with mode 0600 and writes `data`.
// Throws std::system_error with EEXIST if it already exists.
void write_file_exclusive(const std::filesystem::path& path, const std::string& data);

}
