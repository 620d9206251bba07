/**
 * StateFile.cpp
 *
 * JSON persistence of accounts and directory rules.
 */

#include "StateFile.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <utility>

namespace gas::core::accounts {

using json = nlohmann::json;

namespace {

json toJson(const StateSnapshot& snapshot) {
    json root = {
        {"version", StateFile::FORMAT_VERSION},
        {"accounts", snapshot.accounts},
        {"rules", snapshot.rules},
        {"nextSequence", snapshot.nextSequence}
    };
    root["default"] = snapshot.defaultAccount ? json(*snapshot.defaultAccount) : json(nullptr);
    return root;
}

StateSnapshot fromJson(const json& root) {
    StateSnapshot snapshot;

    if (root.contains("accounts")) {
        snapshot.accounts = root.at("accounts").get<std::vector<models::Account>>();
    }
    if (root.contains("rules")) {
        snapshot.rules = root.at("rules").get<std::vector<models::DirectoryRule>>();
    }
    if (root.contains("default") && root["default"].is_string()) {
        snapshot.defaultAccount = root["default"].get<std::string>();
    }

    snapshot.nextSequence = root.value("nextSequence", uint64_t{1});

    // Never hand out a sequence number already used by a stored rule
    for (const auto& rule : snapshot.rules) {
        snapshot.nextSequence = std::max(snapshot.nextSequence, rule.sequence + 1);
    }

    return snapshot;
}

} // namespace

const models::Account* StateSnapshot::findAccount(const std::string& nickname) const {
    auto it = std::find_if(accounts.begin(), accounts.end(),
        [&](const models::Account& account) { return account.nickname == nickname; });
    return it != accounts.end() ? &*it : nullptr;
}

models::Account* StateSnapshot::findAccount(const std::string& nickname) {
    auto it = std::find_if(accounts.begin(), accounts.end(),
        [&](const models::Account& account) { return account.nickname == nickname; });
    return it != accounts.end() ? &*it : nullptr;
}

StateFile::StateFile(std::filesystem::path path, utils::LockPolicy policy)
    : m_path(std::move(path))
    , m_policy(policy) {
}

std::filesystem::path StateFile::lockPath() const {
    auto lock = m_path;
    lock += ".lock";
    return lock;
}

std::filesystem::path StateFile::accountLockPath(const std::string& nickname) const {
    auto lock = m_path;
    lock += "." + nickname + ".lock";
    return lock;
}

void StateFile::withAccountLock(const std::string& nickname, const std::function<void()>& action) const {
    auto path = accountLockPath(nickname);
    utils::FileLock lock(path, m_policy);
    if (!lock.isLocked()) {
        LOG_WARN("Could not lock {} after {} attempts", path.string(), lock.attempts());
        throw GasError(ErrorKind::Lock, "account '" + nickname + "' is locked by another gas process");
    }

    action();
}

StateSnapshot StateFile::load() const {
    if (!utils::FileUtils::fileExists(m_path)) {
        return {};
    }

    auto content = utils::FileUtils::readFile(m_path);
    if (!content) {
        throw GasError(ErrorKind::Config, "cannot read " + m_path.string());
    }

    try {
        return fromJson(json::parse(*content));
    } catch (const json::exception& e) {
        LOG_ERROR("State file {} is corrupt: {}", m_path.string(), e.what());
        throw GasError(ErrorKind::Config, "state file " + m_path.string() + " is corrupt: " + e.what());
    }
}

StateSnapshot StateFile::update(const Mutation& mutate) {
    utils::FileLock lock(lockPath(), m_policy);
    if (!lock.isLocked()) {
        LOG_WARN("Could not lock {} after {} attempts", lockPath().string(), lock.attempts());
        throw GasError(ErrorKind::Lock, "state is locked by another gas process: " + lockPath().string());
    }

    StateSnapshot snapshot = load();
    mutate(snapshot);

    if (!utils::FileUtils::writeFileAtomic(m_path, toJson(snapshot).dump(2) + "\n")) {
        throw GasError(ErrorKind::Config, "cannot write " + m_path.string());
    }

    LOG_DEBUG("State written: {} accounts, {} rules", snapshot.accounts.size(), snapshot.rules.size());
    return snapshot;
}

} // namespace gas::core::accounts
