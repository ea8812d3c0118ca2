#include "store_file.hpp"
#include "errors.hpp"
#include "security_logger.hpp"

#include <cerrno>
#include <memory>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace confshield {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void write_all(int fd, const unsigned char* data, size_t size, const std::string& what) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("write " + what);
        }
        written += static_cast<size_t>(n);
    }
}

void fsync_directory(const std::filesystem::path& dir) {
    FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) throw_errno("open directory " + dir.string());
    if (::fsync(fd.get()) != 0) throw_errno("fsync directory " + dir.string());
    fd.close(dir.string());
}

std::filesystem::path parent_or_cwd(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    return parent.empty() ? std::filesystem::path(".") : parent;
}

}

// --- FileDescriptor ---

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.release();
    }
    return *this;
}

int FileDescriptor::release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::close(const std::string& what) {
    int fd = release();
    if (fd >= 0 && ::close(fd) != 0) {
        throw_errno("close " + what);
    }
}

// --- StoreLock ---

StoreLock StoreLock::acquire(const std::filesystem::path& lock_path,
                             std::chrono::milliseconds timeout) {
    std::error_code ec;
    std::filesystem::create_directories(parent_or_cwd(lock_path), ec);
    if (ec) {
        throw std::system_error(ec, "create directory for " + lock_path.string());
    }

    FileDescriptor fd(::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
    if (!fd.valid()) throw_errno("open lock file " + lock_path.string());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) throw_errno("flock " + lock_path.string());

        if (std::chrono::steady_clock::now() >= deadline) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_LOCKED,
                                lock_path.string(), "store is held by another process");
            throw StoreLockedError("mapping store is locked by another process: " + lock_path.string());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    return StoreLock(std::move(fd), lock_path);
}

StoreLock::~StoreLock() {
    if (fd_.valid()) {
        ::flock(fd_.get(), LOCK_UN);
    }
}

// --- File I/O ---

std::vector<unsigned char> read_file(const std::filesystem::path& path) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) {
            throw StoreNotFoundError("no mapping store at " + path.string());
        }
        throw_errno("open " + path.string());
    }

    struct stat st;
    if (::fstat(fd.get(), &st) != 0) throw_errno("stat " + path.string());

    std::vector<unsigned char> data;
    data.reserve(static_cast<size_t>(st.st_size));
    unsigned char buffer[8192];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("read " + path.string());
        }
        if (n == 0) break;
        data.insert(data.end(), buffer, buffer + n);
    }
    fd.close(path.string());
    return data;
}

void write_file_atomic(const std::filesystem::path& path, const std::vector<unsigned char>& data) {
    auto dir = parent_or_cwd(path);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::system_error(ec, "create directory " + dir.string());
    }

    std::string tmp_template = path.string() + ".XXXXXX";
    std::vector<char> tmp_name(tmp_template.begin(), tmp_template.end());
    tmp_name.push_back('\0');

    // mkstemp creates the file with mode 0600.
    FileDescriptor fd(::mkstemp(tmp_name.data()));
    if (!fd.valid()) throw_errno("create temp file for " + path.string());
    std::string tmp_path(tmp_name.data());

    bool committed = false;
    auto cleanup = std::shared_ptr<void>(nullptr, [&committed, &tmp_path](void*) {
        if (!committed) ::unlink(tmp_path.c_str());
    });

    write_all(fd.get(), data.data(), data.size(), tmp_path);
    if (::fsync(fd.get()) != 0) throw_errno("fsync " + tmp_path);
    fd.close(tmp_path);

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw_errno("rename " + tmp_path + " -> " + path.string());
    }
    committed = true;

    fsync_directory(dir);
}

void write_file_exclusive(const std::filesystem::path& path, const std::string& data) {
    auto dir = parent_or_cwd(path);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::system_error(ec, "create directory " + dir.string());
    }

    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    if (!fd.valid()) throw_errno("create " + path.string());

    write_all(fd.get(), reinterpret_cast<const unsigned char*>(data.data()), data.size(), path.string());
    if (::fsync(fd.get()) != 0) throw_errno("fsync " + path.string());
    fd.close(path.string());
}

}
