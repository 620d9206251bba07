#pragma once

/**
 * ResolutionChain.hpp
 *
 * Ordered account selection: each strategy either names an account or
 * passes. The first strategy that names one wins.
 */

#include "OverrideContext.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gas::core::accounts {
class AccountStore;
class RuleResolver;
}

namespace gas::core::credential {

/**
 * Inputs available to every strategy
 */
struct ResolutionRequest {
    std::filesystem::path cwd;
    std::string host;
};

/**
 * Chosen account and the strategy that chose it
 */
struct Resolution {
    std::string nickname;
    std::string source;
};

/**
 * ResolutionStrategy - one precedence layer
 */
class ResolutionStrategy {
public:
    virtual ~ResolutionStrategy() = default;

    virtual std::string name() const = 0;
    virtual std::optional<std::string> resolve(const ResolutionRequest& request) const = 0;
};

class OverrideStrategy : public ResolutionStrategy {
public:
    explicit OverrideStrategy(OverrideContext context);

    std::string name() const override { return "override"; }
    std::optional<std::string> resolve(const ResolutionRequest& request) const override;

private:
    OverrideContext m_context;
};

class DirectoryRuleStrategy : public ResolutionStrategy {
public:
    explicit DirectoryRuleStrategy(const accounts::RuleResolver& rules);

    std::string name() const override { return "directory"; }
    std::optional<std::string> resolve(const ResolutionRequest& request) const override;

private:
    const accounts::RuleResolver& m_rules;
};

class DefaultAccountStrategy : public ResolutionStrategy {
public:
    explicit DefaultAccountStrategy(const accounts::AccountStore& accounts);

    std::string name() const override { return "default"; }
    std::optional<std::string> resolve(const ResolutionRequest& request) const override;

private:
    const accounts::AccountStore& m_accounts;
};

/**
 * ResolutionChain - strategies tried in insertion order
 */
class ResolutionChain {
public:
    ResolutionChain() = default;

    ResolutionChain(const ResolutionChain&) = delete;
    ResolutionChain& operator=(const ResolutionChain&) = delete;

    ResolutionChain& add(std::unique_ptr<ResolutionStrategy> strategy);

    /**
     * Run the strategies
     * @return First answer, nullopt if every strategy passed
     */
    std::optional<Resolution> resolve(const ResolutionRequest& request) const;

    size_t size() const { return m_strategies.size(); }

    /**
     * Standard order: override, then directory rules, then the default account
     */
    static std::unique_ptr<ResolutionChain> standard(OverrideContext context,
                                                     const accounts::RuleResolver& rules,
                                                     const accounts::AccountStore& accounts);

private:
    std::vector<std::unique_ptr<ResolutionStrategy>> m_strategies;
};

} // namespace gas::core::credential
