#pragma once

/**
 * StateFile.hpp
 *
 * On-disk account and directory-rule table (state.json).
 * Readers take no lock and always see a complete file; writers serialize on
 * an exclusive lock held on a sibling ".lock" file.
 */

#include "../../models/Account.hpp"
#include "../../utils/FileUtils.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gas::core::accounts {

/**
 * Persisted metadata, secrets excluded
 */
struct StateSnapshot {
    std::vector<models::Account> accounts;        // insertion order
    std::vector<models::DirectoryRule> rules;
    std::optional<std::string> defaultAccount;
    uint64_t nextSequence{1};

    const models::Account* findAccount(const std::string& nickname) const;
    models::Account* findAccount(const std::string& nickname);
};

/**
 * StateFile - consistent snapshots and locked read-modify-write
 */
class StateFile {
public:
    static constexpr int FORMAT_VERSION = 1;

    using Mutation = std::function<void(StateSnapshot&)>;

    /**
     * Constructor
     * @param path Location of state.json
     * @param policy Lock retry policy for writers
     */
    explicit StateFile(std::filesystem::path path, utils::LockPolicy policy = {});

    /**
     * Read the current snapshot without locking
     * @return Snapshot, empty if the file does not exist yet
     * @throws GasError(Config) if the file exists but cannot be parsed
     */
    StateSnapshot load() const;

    /**
     * Apply a mutation under the exclusive lock and persist it atomically
     *
     * If the mutation throws, nothing is written and the lock is released.
     *
     * @param mutate Change applied to the freshly read snapshot
     * @return The snapshot as written
     * @throws GasError(Lock) if the lock could not be acquired within the retry policy
     * @throws GasError(Config) if the file could not be read or written
     */
    StateSnapshot update(const Mutation& mutate);

    /**
     * Run an action while holding one account's exclusive lock
     *
     * The account lock is separate from the state lock, so the action may
     * call update().
     *
     * @param nickname Account nickname
     * @param action Work done under the lock
     * @throws GasError(Lock) if the lock could not be acquired within the retry policy
     */
    void withAccountLock(const std::string& nickname, const std::function<void()>& action) const;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path lockPath() const;
    std::filesystem::path accountLockPath(const std::string& nickname) const;

private:
    std::filesystem::path m_path;
    utils::LockPolicy m_policy;
};

} // namespace gas::core::accounts
