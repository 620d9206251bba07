/**
 * OverrideContext.cpp
 */

#include "OverrideContext.hpp"
#include "../../utils/PlatformUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace gas::core::credential {

OverrideContext::OverrideContext(std::optional<std::string> nickname)
    : m_nickname(std::move(nickname)) {
    if (m_nickname && m_nickname->empty()) {
        m_nickname.reset();
    }
}

OverrideContext OverrideContext::fromEnvironment() {
    auto value = utils::PlatformUtils::getEnv(ENV_VAR);
    if (!value) {
        return OverrideContext{};
    }
    return OverrideContext(utils::StringUtils::trim(*value));
}

std::map<std::string, std::string> OverrideContext::childEnvironment(const std::string& nickname) {
    return {{ENV_VAR, nickname}};
}

} // namespace gas::core::credential
