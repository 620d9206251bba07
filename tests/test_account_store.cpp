#include <gtest/gtest.h>
#include <core/Errors.hpp>
#include <core/accounts/AccountStore.hpp>
#include <core/accounts/RuleResolver.hpp>
#include <core/auth/TokenStorage.hpp>

#include "support/MemoryVault.hpp"
#include "support/TempDir.hpp"

namespace fs = std::filesystem;

using gas::core::GasError;
using gas::core::accounts::AccountStore;
using gas::core::accounts::RuleResolver;
using gas::core::accounts::StateFile;
using gas::core::auth::TokenStorage;
using gas::models::Account;
using gas::models::AuthKind;
using gas::models::Token;

class AccountStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    gas::test::MemoryVault vault;
    std::unique_ptr<TokenStorage> tokens;
    std::unique_ptr<StateFile> state;
    std::unique_ptr<AccountStore> store;

    void SetUp() override {
        test_dir = gas::test::makeTempDir("gas_store");
        tokens = std::make_unique<TokenStorage>(vault, "gas");
        state = std::make_unique<StateFile>(test_dir / "state.json");
        store = std::make_unique<AccountStore>(*state, *tokens);
    }

    void TearDown() override {
        store.reset();
        state.reset();
        fs::remove_all(test_dir);
    }

    void addWithSecret(const std::string& nickname, AuthKind kind = AuthKind::OAuthToken) {
        Token token;
        token.secret = "secret-" + nickname;
        tokens->storeToken(nickname, token);
        store->put(Account{nickname, "github.com", nickname + "-login", kind});
    }
};

TEST_F(AccountStoreTest, EmptyStore) {
    EXPECT_TRUE(store->list().empty());
    EXPECT_FALSE(store->get("any").has_value());
    EXPECT_FALSE(store->defaultAccount().has_value());
}

TEST_F(AccountStoreTest, ListKeepsInsertionOrder) {
    addWithSecret("zeta");
    addWithSecret("alpha");
    addWithSecret("mid");

    auto accounts = store->list();
    ASSERT_EQ(accounts.size(), 3u);
    EXPECT_EQ(accounts[0].nickname, "zeta");
    EXPECT_EQ(accounts[1].nickname, "alpha");
    EXPECT_EQ(accounts[2].nickname, "mid");
}

TEST_F(AccountStoreTest, PutReplacesWholeRecordInPlace) {
    addWithSecret("first");
    addWithSecret("second", AuthKind::OAuthToken);

    store->put(Account{"second", "gitlab.com", "new-login", AuthKind::StaticPassword});

    auto accounts = store->list();
    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[1].nickname, "second");
    EXPECT_EQ(accounts[1].host, "gitlab.com");
    EXPECT_EQ(accounts[1].username, "new-login");
    EXPECT_EQ(accounts[1].kind, AuthKind::StaticPassword);
}

TEST_F(AccountStoreTest, FirstAccountBecomesDefault) {
    addWithSecret("first");
    addWithSecret("second");
    EXPECT_EQ(store->defaultAccount(), "first");

    store->setDefault("second");
    EXPECT_EQ(store->defaultAccount(), "second");
}

TEST_F(AccountStoreTest, SetDefaultRequiresAccount) {
    EXPECT_THROW(store->setDefault("ghost"), GasError);
}

TEST_F(AccountStoreTest, RemoveCascades) {
    addWithSecret("work");
    addWithSecret("personal");

    RuleResolver resolver(*state, false);
    resolver.setRule("/proj", "work");
    resolver.setRule("/home", "personal");

    EXPECT_TRUE(store->remove("work"));

    EXPECT_FALSE(store->get("work").has_value());
    EXPECT_FALSE(vault.contains("gas:work"));
    EXPECT_FALSE(resolver.resolve("/proj/repo").has_value());
    EXPECT_FALSE(store->defaultAccount().has_value());

    // Other accounts are untouched
    EXPECT_TRUE(vault.contains("gas:personal"));
    EXPECT_EQ(resolver.resolve("/home/x"), "personal");
}

TEST_F(AccountStoreTest, RemoveUnknownReturnsFalse) {
    addWithSecret("work");
    EXPECT_FALSE(store->remove("ghost"));
    EXPECT_EQ(store->list().size(), 1u);
}

TEST_F(AccountStoreTest, RetriedRemoveClearsLeftoverSecret) {
    addWithSecret("work");
    vault.failNextRemove = true;

    // Metadata goes first; the vault failure leaves the secret behind
    EXPECT_THROW(store->remove("work"), GasError);
    EXPECT_FALSE(store->get("work").has_value());
    EXPECT_TRUE(vault.contains("gas:work"));

    EXPECT_TRUE(store->remove("work"));
    EXPECT_FALSE(vault.contains("gas:work"));

    EXPECT_FALSE(store->remove("work"));
}

TEST_F(AccountStoreTest, StateNeverContainsSecrets) {
    addWithSecret("work");

    auto content = gas::utils::FileUtils::readFile(state->path());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->find("secret-work"), std::string::npos);
}

TEST_F(AccountStoreTest, PersistsAcrossInstances) {
    addWithSecret("work");

    StateFile reopened(test_dir / "state.json");
    AccountStore other(reopened, *tokens);
    auto account = other.get("work");
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->username, "work-login");
}
