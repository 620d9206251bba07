// gas - File Utilities
// File reads, atomic replacement and advisory locking

#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace gas::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    static bool createDirectories(const fs::path& path);
    static bool fileExists(const fs::path& path);

    static std::optional<std::string> readFile(const fs::path& path);

    /**
     * @brief Replace a file's content atomically
     *
     * Content goes to a sibling temp file which is fsync'ed and renamed over
     * the target, so concurrent readers see either the old or the new file.
     * The file is created with owner-only permissions.
     *
     * @return false if any step failed; the target is left untouched then
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content);

    static std::string getExecutablePath();
};

/**
 * @brief Retry policy for FileLock
 */
struct LockPolicy {
    int retries{20};
    std::chrono::milliseconds backoff{25};
    std::chrono::milliseconds maxBackoff{500};
};

/**
 * @brief RAII exclusive file lock (flock)
 */
class FileLock {
public:
    // Single non-blocking attempt
    explicit FileLock(const fs::path& path);
    // Retries with exponential backoff, bounded by policy
    FileLock(const fs::path& path, const LockPolicy& policy);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool isLocked() const { return m_locked; }
    int attempts() const { return m_attempts; }
    void unlock();

private:
    bool tryLock();

    fs::path m_path;
    bool m_locked{false};
    int m_attempts{0};
    int m_fd{-1};
};

} // namespace gas::utils
