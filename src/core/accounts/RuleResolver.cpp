/**
 * RuleResolver.cpp
 *
 * Directory rule normalization and matching.
 */

#include "RuleResolver.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace gas::core::accounts {

using utils::StringUtils;

RuleResolver::RuleResolver(StateFile& state, bool caseInsensitive)
    : m_state(state)
    , m_caseInsensitive(caseInsensitive) {
}

std::string RuleResolver::normalize(const std::filesystem::path& path, bool caseInsensitive) {
    std::filesystem::path absolute = path;
    if (absolute.is_relative()) {
        absolute = std::filesystem::current_path() / absolute;
    }

    std::string text = StringUtils::replaceAll(absolute.generic_string(), "\\", "/");
    text = std::filesystem::path(text).lexically_normal().generic_string();

    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }

    return caseInsensitive ? StringUtils::toLower(text) : text;
}

bool RuleResolver::isAncestorOrSelf(const std::string& prefix, const std::string& directory) {
    if (!StringUtils::startsWith(directory, prefix)) {
        return false;
    }
    if (directory.size() == prefix.size() || prefix.back() == '/') {
        return true;
    }
    return directory[prefix.size()] == '/';
}

size_t RuleResolver::segmentCount(const std::string& normalized) {
    size_t count = 0;
    for (const auto& part : StringUtils::split(normalized, '/')) {
        if (!part.empty()) {
            ++count;
        }
    }
    return count;
}

std::optional<models::DirectoryRule> RuleResolver::bestMatch(
    const std::vector<models::DirectoryRule>& rules,
    const std::string& normalizedDirectory) {

    const models::DirectoryRule* best = nullptr;
    size_t bestSegments = 0;

    for (const auto& rule : rules) {
        if (rule.prefix.empty() || !isAncestorOrSelf(rule.prefix, normalizedDirectory)) {
            continue;
        }

        size_t segments = segmentCount(rule.prefix);
        if (!best || segments > bestSegments
            || (segments == bestSegments && rule.sequence > best->sequence)) {
            best = &rule;
            bestSegments = segments;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return *best;
}

std::optional<std::string> RuleResolver::resolve(const std::filesystem::path& cwd) const {
    auto snapshot = m_state.load();
    auto directory = normalize(cwd, m_caseInsensitive);

    // Rules are compared in the same case mode regardless of how they were written
    std::vector<models::DirectoryRule> rules = snapshot.rules;
    if (m_caseInsensitive) {
        for (auto& rule : rules) {
            rule.prefix = StringUtils::toLower(rule.prefix);
        }
    }

    auto match = bestMatch(rules, directory);
    if (!match) {
        LOG_DEBUG("No directory rule matches {}", directory);
        return std::nullopt;
    }

    LOG_DEBUG("Directory {} matched rule {} -> {}", directory, match->prefix, match->nickname);
    return match->nickname;
}

models::DirectoryRule RuleResolver::setRule(const std::filesystem::path& directory, const std::string& nickname) {
    models::DirectoryRule stored;
    stored.prefix = normalize(directory, m_caseInsensitive);
    stored.nickname = nickname;

    m_state.update([&](StateSnapshot& snapshot) {
        if (!snapshot.findAccount(nickname)) {
            throw GasError(ErrorKind::NotFound, "no account named '" + nickname + "'");
        }

        stored.sequence = snapshot.nextSequence++;

        auto sameDirectory = [&](const models::DirectoryRule& rule) {
            return m_caseInsensitive ? StringUtils::equalsIgnoreCase(rule.prefix, stored.prefix)
                                     : rule.prefix == stored.prefix;
        };
        snapshot.rules.erase(
            std::remove_if(snapshot.rules.begin(), snapshot.rules.end(), sameDirectory),
            snapshot.rules.end());
        snapshot.rules.push_back(stored);
    });

    LOG_INFO("Directory {} now uses account {}", stored.prefix, nickname);
    return stored;
}

std::vector<models::DirectoryRule> RuleResolver::rules() const {
    auto rules = m_state.load().rules;
    std::sort(rules.begin(), rules.end(),
        [](const models::DirectoryRule& a, const models::DirectoryRule& b) { return a.prefix < b.prefix; });
    return rules;
}

} // namespace gas::core::accounts
