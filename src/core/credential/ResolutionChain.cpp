/**
 * ResolutionChain.cpp
 *
 * Account selection strategies.
 */

#include "ResolutionChain.hpp"
#include "../Logger.hpp"
#include "../accounts/AccountStore.hpp"
#include "../accounts/RuleResolver.hpp"

#include <utility>

namespace gas::core::credential {

OverrideStrategy::OverrideStrategy(OverrideContext context)
    : m_context(std::move(context)) {
}

std::optional<std::string> OverrideStrategy::resolve(const ResolutionRequest&) const {
    return m_context.nickname();
}

DirectoryRuleStrategy::DirectoryRuleStrategy(const accounts::RuleResolver& rules)
    : m_rules(rules) {
}

std::optional<std::string> DirectoryRuleStrategy::resolve(const ResolutionRequest& request) const {
    return m_rules.resolve(request.cwd);
}

DefaultAccountStrategy::DefaultAccountStrategy(const accounts::AccountStore& accounts)
    : m_accounts(accounts) {
}

std::optional<std::string> DefaultAccountStrategy::resolve(const ResolutionRequest&) const {
    return m_accounts.defaultAccount();
}

ResolutionChain& ResolutionChain::add(std::unique_ptr<ResolutionStrategy> strategy) {
    m_strategies.push_back(std::move(strategy));
    return *this;
}

std::optional<Resolution> ResolutionChain::resolve(const ResolutionRequest& request) const {
    for (const auto& strategy : m_strategies) {
        if (auto nickname = strategy->resolve(request)) {
            LOG_DEBUG("Account {} selected by {}", *nickname, strategy->name());
            return Resolution{*nickname, strategy->name()};
        }
    }
    return std::nullopt;
}

std::unique_ptr<ResolutionChain> ResolutionChain::standard(OverrideContext context,
                                                           const accounts::RuleResolver& rules,
                                                           const accounts::AccountStore& accounts) {
    auto chain = std::make_unique<ResolutionChain>();
    chain->add(std::make_unique<OverrideStrategy>(std::move(context)))
          .add(std::make_unique<DirectoryRuleStrategy>(rules))
          .add(std::make_unique<DefaultAccountStrategy>(accounts));
    return chain;
}

} // namespace gas::core::credential
