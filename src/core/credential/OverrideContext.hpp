#pragma once

/**
 * OverrideContext.hpp
 *
 * Single-invocation account selection for "gas with <nickname> <cmd>".
 * The binding travels only through the environment of the child process
 * tree and is never persisted.
 */

#include <map>
#include <optional>
#include <string>

namespace gas::core::credential {

class OverrideContext {
public:
    static constexpr const char* ENV_VAR = "GAS_ACCOUNT_OVERRIDE";

    OverrideContext() = default;
    explicit OverrideContext(std::optional<std::string> nickname);

    /**
     * Read the override inherited by this process
     * @return Context, unset when the variable is absent or empty
     */
    static OverrideContext fromEnvironment();

    /**
     * Environment additions that bind a child process tree to an account
     * @param nickname Account nickname
     */
    static std::map<std::string, std::string> childEnvironment(const std::string& nickname);

    bool isSet() const { return m_nickname.has_value(); }
    const std::optional<std::string>& nickname() const { return m_nickname; }

private:
    std::optional<std::string> m_nickname;
};

} // namespace gas::core::credential
