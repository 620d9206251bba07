#pragma once

/**
 * RuleResolver.hpp
 *
 * Maps a working directory to an account nickname through directory rules.
 * The rule with the most path segments that is an ancestor of (or equal to)
 * the directory wins; equal specificity goes to the most recent write.
 */

#include "StateFile.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gas::core::accounts {

/**
 * RuleResolver - longest-prefix directory matching
 */
class RuleResolver {
public:
    /**
     * Constructor
     * @param state Persisted rule table
     * @param caseInsensitive Fold case when comparing paths
     */
    RuleResolver(StateFile& state, bool caseInsensitive);

    /**
     * Resolve the account for a directory
     * @param cwd Directory, relative paths are taken against the process cwd
     * @return Nickname of the best rule, nullopt if none matches
     */
    std::optional<std::string> resolve(const std::filesystem::path& cwd) const;

    /**
     * Bind a directory to an account, replacing any rule for the same directory
     * @param directory Directory to bind
     * @param nickname Existing account nickname
     * @return The stored rule
     * @throws GasError(NotFound) if the account does not exist
     */
    models::DirectoryRule setRule(const std::filesystem::path& directory, const std::string& nickname);

    /**
     * Get all rules ordered by prefix
     */
    std::vector<models::DirectoryRule> rules() const;

    /**
     * Normalize a path for storage and comparison
     *
     * Absolute, '/' separated, lexically normal, no trailing separator
     * except for the root, lower-cased when case-insensitive.
     */
    static std::string normalize(const std::filesystem::path& path, bool caseInsensitive);

    /**
     * Pick the best rule for an already normalized directory
     * @return Matching rule or nullopt
     */
    static std::optional<models::DirectoryRule> bestMatch(
        const std::vector<models::DirectoryRule>& rules,
        const std::string& normalizedDirectory);

    /**
     * Whether prefix is the directory itself or one of its ancestors, by whole segments
     */
    static bool isAncestorOrSelf(const std::string& prefix, const std::string& directory);

    static size_t segmentCount(const std::string& normalized);

private:
    StateFile& m_state;
    bool m_caseInsensitive;
};

} // namespace gas::core::accounts
