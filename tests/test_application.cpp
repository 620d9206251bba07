#include <gtest/gtest.h>
#include <core/Application.hpp>
#include <core/accounts/StateFile.hpp>

#include "support/FakeHttp.hpp"
#include "support/MemoryVault.hpp"
#include "support/TempDir.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using gas::core::Application;
using gas::core::StartupOptions;
using gas::core::accounts::StateFile;

static const char* GITHUB_REQUEST = "protocol=https\nhost=github.com\n\n";

class ApplicationTest : public ::testing::Test {
protected:
    fs::path config_dir;
    gas::test::MemoryVault* vault{nullptr};
    gas::test::FakeHttp* http{nullptr};
    std::unique_ptr<Application> app;
    std::string output;

    void SetUp() override {
        config_dir = gas::test::makeTempDir("gas_app");
    }

    void TearDown() override {
        app.reset();
        fs::remove_all(config_dir);
    }

    void writeQuietConfig() {
        std::ofstream(config_dir / "config.json") << R"({"logging":{"level":"off","file":false}})";
    }

    bool start(bool helperMode = false) {
        auto ownedVault = std::make_unique<gas::test::MemoryVault>();
        auto ownedHttp = std::make_unique<gas::test::FakeHttp>();
        vault = ownedVault.get();
        http = ownedHttp.get();
        app = std::make_unique<Application>(config_dir, std::move(ownedVault), std::move(ownedHttp));

        StartupOptions options;
        options.helperMode = helperMode;
        return app->initialize(options);
    }

    // Runs a command with stdin fed from input and stdout captured in output
    int run(const std::string& command, const std::vector<std::string>& args = {},
            const std::string& input = "") {
        std::istringstream in(input);
        std::ostringstream out;
        auto* savedIn = std::cin.rdbuf(in.rdbuf());
        auto* savedOut = std::cout.rdbuf(out.rdbuf());

        int status = app->run(command, args);

        std::cin.clear();
        std::cin.rdbuf(savedIn);
        std::cout.rdbuf(savedOut);
        output = out.str();
        return status;
    }

    int addToken(const std::string& nickname) {
        return run("add", {nickname, "--username", nickname + "-login", "--token"}, "ghp_" + nickname + "\n");
    }

    gas::core::accounts::StateSnapshot state() const {
        return StateFile(config_dir / "state.json").load();
    }
};

// Restores the working directory on scope exit
class ScopedCwd {
public:
    explicit ScopedCwd(const fs::path& dir) : m_saved(fs::current_path()) { fs::current_path(dir); }
    ~ScopedCwd() { fs::current_path(m_saved); }

private:
    fs::path m_saved;
};

TEST_F(ApplicationTest, RunBeforeInitializeFails) {
    Application plain(config_dir);
    EXPECT_EQ(plain.run("list", {}), 1);
}

TEST_F(ApplicationTest, FirstCommandWritesDefaultConfig) {
    ASSERT_TRUE(start());
    EXPECT_TRUE(fs::exists(config_dir / "config.json"));

    std::ifstream file(config_dir / "config.json");
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("\"clientId\""), std::string::npos);
}

TEST_F(ApplicationTest, HelperRunLeavesConfigAlone) {
    ASSERT_TRUE(start(true));
    EXPECT_FALSE(fs::exists(config_dir / "config.json"));

    EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(ApplicationTest, UnknownCommandIsUsageError) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    EXPECT_EQ(run("frobnicate"), 2);
}

TEST_F(ApplicationTest, AddedTokenIsServedToGit) {
    writeQuietConfig();
    ASSERT_TRUE(start());

    ASSERT_EQ(addToken("work"), 0);
    EXPECT_TRUE(http->requests.empty());

    EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 0);
    EXPECT_EQ(output, "username=work-login\npassword=ghp_work\n\n");

    EXPECT_EQ(run("get", {}, "protocol=https\nhost=gitlab.com\n\n"), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(ApplicationTest, HelperErrorsProduceNoOutput) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("get", {}, "protocol=https\n\n"), 2);
    EXPECT_TRUE(output.empty());

    vault->failReads = true;
    EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 1);
    EXPECT_TRUE(output.empty());
}

TEST_F(ApplicationTest, StoreAndEraseAreAccepted) {
    writeQuietConfig();
    ASSERT_TRUE(start(true));

    EXPECT_EQ(run("store", {}, "protocol=https\nhost=github.com\nusername=x\npassword=y\n\n"), 0);
    EXPECT_EQ(run("erase", {}, GITHUB_REQUEST), 0);
    EXPECT_TRUE(output.empty());
    EXPECT_EQ(vault->size(), 0u);
}

TEST_F(ApplicationTest, AddNeedsSecretOnStdin) {
    writeQuietConfig();
    ASSERT_TRUE(start());

    EXPECT_EQ(run("add", {"work", "--username", "me", "--token"}, ""), 2);
    EXPECT_EQ(run("add", {}), 2);
    EXPECT_EQ(run("add", {"work", "--host"}), 2);
    EXPECT_EQ(run("add", {"work", "--bogus"}), 2);
    EXPECT_TRUE(state().accounts.empty());
}

TEST_F(ApplicationTest, CancelledAddStoresNothing) {
    writeQuietConfig();
    ASSERT_TRUE(start());

    app->cancel();
    EXPECT_EQ(run("add", {"work", "--username", "me", "--token"}, "ghp_x\n"), 130);

    EXPECT_TRUE(state().accounts.empty());
    EXPECT_EQ(vault->size(), 0u);
}

TEST_F(ApplicationTest, UseWithPathBindsDirectory) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);
    ASSERT_EQ(addToken("personal"), 0);

    fs::create_directories(config_dir / "proj" / "repo");
    auto project = fs::canonical(config_dir / "proj");

    EXPECT_EQ(run("use", {"personal", "--path", project.string()}), 0);

    auto rules = state().rules;
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].nickname, "personal");

    {
        ScopedCwd cwd(project / "repo");
        EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 0);
        EXPECT_EQ(output, "username=personal-login\npassword=ghp_personal\n\n");
    }

    // Outside the bound directory the default account still applies
    EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 0);
    EXPECT_EQ(output, "username=work-login\npassword=ghp_work\n\n");
}

TEST_F(ApplicationTest, UseRejectsBadArguments) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("use", {}), 2);
    EXPECT_EQ(run("use", {"work", "--path"}), 2);
    EXPECT_EQ(run("use", {"work", "extra"}), 2);
    EXPECT_EQ(run("use", {"ghost", "--path", config_dir.string()}), 1);
    EXPECT_TRUE(state().rules.empty());
}

TEST_F(ApplicationTest, RemoveUnknownAccountFails) {
    writeQuietConfig();
    ASSERT_TRUE(start());

    EXPECT_EQ(run("remove", {"ghost"}), 1);
    EXPECT_EQ(run("remove", {}), 2);
}

TEST_F(ApplicationTest, RemoveClearsLeftoverSecret) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    vault->put("gas:ghost", "left-behind");

    EXPECT_EQ(run("remove", {"ghost"}), 0);
    EXPECT_FALSE(vault->contains("gas:ghost"));
}

TEST_F(ApplicationTest, RemovedAccountIsNoLongerServed) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("remove", {"work"}), 0);
    EXPECT_EQ(vault->size(), 0u);

    EXPECT_EQ(run("get", {}, GITHUB_REQUEST), 0);
    EXPECT_TRUE(output.empty());
}

TEST_F(ApplicationTest, DefaultCommand) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);
    ASSERT_EQ(addToken("personal"), 0);

    EXPECT_EQ(run("default", {"personal"}), 0);
    EXPECT_EQ(state().defaultAccount, "personal");

    EXPECT_EQ(run("default", {"ghost"}), 1);
    EXPECT_EQ(run("default", {}), 2);
    EXPECT_EQ(state().defaultAccount, "personal");
}

TEST_F(ApplicationTest, ListShowsAccountsAndDefault) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("list"), 0);
    EXPECT_NE(output.find("work *: work-login@github.com"), std::string::npos);
}

TEST_F(ApplicationTest, WithParsesCommand) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("with", {}), 2);
    EXPECT_EQ(run("with", {"work"}), 2);
    EXPECT_EQ(run("with", {"work", "--"}), 2);
    EXPECT_EQ(run("with", {"ghost", "true"}), 1);
}

TEST_F(ApplicationTest, WithRunsCommandAsAccount) {
    writeQuietConfig();
    ASSERT_TRUE(start());
    ASSERT_EQ(addToken("work"), 0);

    EXPECT_EQ(run("with", {"work", "--", "sh", "-c", "test \"$GAS_ACCOUNT_OVERRIDE\" = work"}), 0);
    EXPECT_EQ(run("with", {"work", "sh", "-c", "exit 3"}), 3);

    // The parent environment is untouched
    EXPECT_EQ(std::getenv("GAS_ACCOUNT_OVERRIDE"), nullptr);
}
