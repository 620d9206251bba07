#include <gtest/gtest.h>
#include <core/accounts/AccountManager.hpp>
#include <core/credential/CredentialHandler.hpp>

#include "support/FakeHttp.hpp"
#include "support/ManualClock.hpp"
#include "support/MemoryVault.hpp"
#include "support/TempDir.hpp"

#include <sstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using gas::core::accounts::AccountManager;
using gas::core::accounts::AccountStore;
using gas::core::accounts::RuleResolver;
using gas::core::accounts::StateFile;
using gas::core::auth::DeviceFlowClient;
using gas::core::auth::TokenStorage;
using gas::core::credential::CredentialHandler;
using gas::core::credential::HelperVerb;
using gas::core::credential::OverrideContext;
using gas::core::credential::ResolutionChain;
using gas::models::AuthKind;
using gas::models::Token;

class CredentialHandlerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    gas::test::MemoryVault vault;
    gas::test::FakeHttp http;
    gas::test::ManualClock clock;

    std::unique_ptr<TokenStorage> tokens;
    std::unique_ptr<StateFile> state;
    std::unique_ptr<AccountStore> store;
    std::unique_ptr<RuleResolver> rules;
    std::unique_ptr<DeviceFlowClient> flow;
    std::unique_ptr<AccountManager> manager;

    void SetUp() override {
        test_dir = gas::test::makeTempDir("gas_handler");
        tokens = std::make_unique<TokenStorage>(vault, "gas");
        state = std::make_unique<StateFile>(test_dir / "state.json");
        store = std::make_unique<AccountStore>(*state, *tokens);
        rules = std::make_unique<RuleResolver>(*state, false);
        flow = std::make_unique<DeviceFlowClient>(http, clock);
        manager = std::make_unique<AccountManager>(*store, *rules, *tokens, *flow);

        manager->addSecretAccount("work", "github.com", "work-user", "work-token", AuthKind::PersonalAccessToken);
        manager->addSecretAccount("personal", "github.com", "me", "personal-token", AuthKind::PersonalAccessToken);
        manager->useDirectory("work", "/proj");
    }

    void TearDown() override {
        manager.reset();
        fs::remove_all(test_dir);
    }

    // One helper invocation with a chain built the way the executable builds it
    int invoke(HelperVerb verb, const std::string& input, const fs::path& cwd,
               std::string& output, OverrideContext context = OverrideContext{}) {
        auto chain = ResolutionChain::standard(context, *rules, *store);
        CredentialHandler handler(*chain, *store, *tokens, *manager, clock);

        std::istringstream in(input);
        std::ostringstream out;
        int status = handler.run(verb, in, out, cwd);
        output = out.str();
        return status;
    }

    int get(const fs::path& cwd, std::string& output, OverrideContext context = OverrideContext{}) {
        return invoke(HelperVerb::Get, "protocol=https\nhost=github.com\n\n", cwd, output, context);
    }
};

TEST_F(CredentialHandlerTest, DirectoryRuleSelectsAccount) {
    std::string output;
    EXPECT_EQ(get("/proj/repo", output), 0);
    EXPECT_EQ(output, "username=work-user\npassword=work-token\n\n");
}

TEST_F(CredentialHandlerTest, DefaultAccountOutsideRules) {
    std::string output;
    EXPECT_EQ(get("/elsewhere", output), 0);
    EXPECT_EQ(output, "username=work-user\npassword=work-token\n\n");

    manager->setDefaultAccount("personal");
    EXPECT_EQ(get("/elsewhere", output), 0);
    EXPECT_EQ(output, "username=me\npassword=personal-token\n\n");
}

TEST_F(CredentialHandlerTest, OverrideAppliesToOneInvocationOnly) {
    std::string output;
    EXPECT_EQ(get("/proj", output, OverrideContext(std::string("personal"))), 0);
    EXPECT_EQ(output, "username=me\npassword=personal-token\n\n");

    EXPECT_EQ(get("/proj", output), 0);
    EXPECT_EQ(output, "username=work-user\npassword=work-token\n\n");
}

TEST_F(CredentialHandlerTest, OverrideForUnknownAccountEmitsNothing) {
    std::string output;
    EXPECT_EQ(get("/proj", output, OverrideContext(std::string("ghost"))), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, RemovedAccountIsNotFound) {
    manager->removeAccount("work");
    manager->removeAccount("personal");

    std::string output;
    EXPECT_EQ(get("/proj/repo", output), 0);
    EXPECT_TRUE(output.empty());
    EXPECT_FALSE(vault.contains("gas:work"));
}

TEST_F(CredentialHandlerTest, MissingHostIsProtocolError) {
    std::string output;
    EXPECT_EQ(invoke(HelperVerb::Get, "protocol=https\npath=x\n\n", "/proj", output), 2);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, GarbageInputIsProtocolError) {
    std::string output;
    EXPECT_EQ(invoke(HelperVerb::Get, "this is not a credential\n\n", "/proj", output), 2);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, OtherHostIsNotAnswered) {
    std::string output;
    EXPECT_EQ(invoke(HelperVerb::Get, "protocol=https\nhost=gitlab.com\n\n", "/proj", output), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, HostComparisonIgnoresCase) {
    std::string output;
    EXPECT_EQ(invoke(HelperVerb::Get, "protocol=https\nhost=GitHub.COM\n\n", "/proj", output), 0);
    EXPECT_EQ(output, "username=work-user\npassword=work-token\n\n");
}

TEST_F(CredentialHandlerTest, VaultFailureEmitsNothing) {
    vault.failReads = true;

    std::string output;
    EXPECT_EQ(get("/proj", output), 1);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, MissingSecretEmitsNothing) {
    vault.remove("gas:work");

    std::string output;
    EXPECT_EQ(get("/proj", output), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, ExpiredOAuthTokenIsRefreshed) {
    Token stale;
    stale.secret = "old";
    stale.refreshToken = "ghr_1";
    stale.expiresAt = clock.now() - 1s;
    tokens->storeToken("work", stale);
    store->put({"work", "github.com", "work-user", AuthKind::OAuthToken});

    http.reply(200, R"({"access_token":"new","refresh_token":"ghr_2","expires_in":3600})");

    std::string output;
    EXPECT_EQ(get("/proj", output), 0);
    EXPECT_EQ(output, "username=work-user\npassword=new\n\n");
    EXPECT_EQ(tokens->getToken("work")->secret, "new");
}

TEST_F(CredentialHandlerTest, FailedRefreshEmitsNothing) {
    Token stale;
    stale.secret = "old";
    stale.refreshToken = "ghr_1";
    stale.expiresAt = clock.now() - 1s;
    tokens->storeToken("work", stale);
    store->put({"work", "github.com", "work-user", AuthKind::OAuthToken});

    http.reply(400, R"({"error":"bad_refresh_token"})");

    std::string output;
    EXPECT_EQ(get("/proj", output), 1);
    EXPECT_TRUE(output.empty());
}

TEST_F(CredentialHandlerTest, StoreAndEraseAreNoOps) {
    std::string output;
    const std::string request = "protocol=https\nhost=github.com\nusername=x\npassword=y\n\n";

    EXPECT_EQ(invoke(HelperVerb::Store, request, "/proj", output), 0);
    EXPECT_TRUE(output.empty());
    EXPECT_EQ(invoke(HelperVerb::Erase, request, "/proj", output), 0);
    EXPECT_TRUE(output.empty());

    EXPECT_EQ(store->list().size(), 2u);
    EXPECT_EQ(tokens->getToken("work")->secret, "work-token");
}

TEST_F(CredentialHandlerTest, StoreWithEmptyInputDoesNotHang) {
    std::string output;
    EXPECT_EQ(invoke(HelperVerb::Store, "", "/proj", output), 0);
}

TEST(ResolutionChainOrder, FirstAnswerWins) {
    struct Fixed : gas::core::credential::ResolutionStrategy {
        std::string label;
        std::optional<std::string> answer;
        Fixed(std::string l, std::optional<std::string> a) : label(std::move(l)), answer(std::move(a)) {}
        std::string name() const override { return label; }
        std::optional<std::string> resolve(const gas::core::credential::ResolutionRequest&) const override {
            return answer;
        }
    };

    ResolutionChain chain;
    chain.add(std::make_unique<Fixed>("first", std::nullopt))
         .add(std::make_unique<Fixed>("second", std::string("b")))
         .add(std::make_unique<Fixed>("third", std::string("c")));

    auto resolution = chain.resolve({"/", "github.com"});
    ASSERT_TRUE(resolution.has_value());
    EXPECT_EQ(resolution->nickname, "b");
    EXPECT_EQ(resolution->source, "second");

    ResolutionChain empty;
    EXPECT_FALSE(empty.resolve({"/", "github.com"}).has_value());
}
