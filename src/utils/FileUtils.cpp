/**
 * FileUtils.cpp
 *
 * File system operations.
 */

#include "FileUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/stat.h>

namespace gas::utils {

// -- Directory/File operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool FileUtils::fileExists(const fs::path& path) { return fs::is_regular_file(path); }

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    if (!createDirectories(path.parent_path())) return false;

    auto tmpPath = path;
    tmpPath += ".tmp." + std::to_string(getpid());

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return false;

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            ::unlink(tmpPath.c_str());
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        ::close(fd);
        ::unlink(tmpPath.c_str());
        return false;
    }
    ::close(fd);

    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        ::unlink(tmpPath.c_str());
        return false;
    }
    return true;
}

std::string FileUtils::getExecutablePath() {
    char buf[4096];
    auto len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    return len > 0 ? std::string(buf, static_cast<size_t>(len)) : "";
}

// -- FileLock --

FileLock::FileLock(const fs::path& path) : m_path(path) {
    tryLock();
}

FileLock::FileLock(const fs::path& path, const LockPolicy& policy) : m_path(path) {
    auto delay = policy.backoff;
    for (int attempt = 0; attempt <= policy.retries; ++attempt) {
        if (tryLock()) return;
        if (m_fd < 0) return;  // lock file cannot be opened, retrying will not help
        if (attempt == policy.retries) break;
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, policy.maxBackoff);
    }
}

FileLock::~FileLock() { unlock(); }

bool FileLock::tryLock() {
    ++m_attempts;
    if (m_fd < 0) {
        if (!FileUtils::createDirectories(m_path.parent_path())) return false;
        m_fd = ::open(m_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
        if (m_fd < 0) return false;
    }
    m_locked = flock(m_fd, LOCK_EX | LOCK_NB) == 0;
    return m_locked;
}

// The lock file itself stays on disk: unlinking it would let a waiter
// lock an orphaned inode while a newcomer locks a fresh one.
void FileLock::unlock() {
    if (m_fd >= 0) {
        if (m_locked) flock(m_fd, LOCK_UN);
        ::close(m_fd);
        m_fd = -1;
    }
    m_locked = false;
}

} // namespace gas::utils
