#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "cli/Commands.hpp"
#include "TestUtil.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace sp::cli;
using ::testing::HasSubstr;

class CliTest : public ::testing::Test {
protected:
    sp::test::TempDir dir;
    std::ostringstream out, err;

    int exec(std::vector<std::string> args) {
        out.str(std::string());
        err.str(std::string());
        args.insert(args.begin(), {"-C", dir.path().string()});
        return run(args, out, err);
    }

    void write(const std::string& rel, const std::string& content) const {
        std::filesystem::create_directories((dir.path() / rel).parent_path());
        std::ofstream(dir.path() / rel, std::ios::binary) << content;
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(dir.path() / rel, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    // "Saved <id> '<label>' (...)"
    std::string savedId() const {
        const auto text = out.str();
        EXPECT_EQ(text.rfind("Saved ", 0), 0u) << text;
        return text.substr(6, 12);
    }
};

TEST_F(CliTest, NoArgumentsPrintsUsage) {
    EXPECT_EQ(run({}, out, err), 1);
    EXPECT_THAT(err.str(), HasSubstr("usage: savepoint"));
}

TEST_F(CliTest, HelpListsCommands) {
    EXPECT_EQ(run({"help"}, out, err), 0);
    for (const auto* cmd : {"init", "save", "list", "checkout", "now", "check-ignore", "stats", "config"})
        EXPECT_THAT(out.str(), HasSubstr(cmd));
}

TEST_F(CliTest, UnknownCommandFails) {
    EXPECT_EQ(exec({"frobnicate"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("unknown command 'frobnicate'"));
}

TEST_F(CliTest, DashCNeedsDirectory) {
    EXPECT_EQ(run({"-C"}, out, err), 1);
    EXPECT_THAT(err.str(), HasSubstr("-C needs a directory"));
}

TEST_F(CliTest, CommandsBeforeInitFail) {
    EXPECT_EQ(exec({"list"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("error: Not a savepoint repository"));
}

TEST_F(CliTest, InitTwiceFails) {
    EXPECT_EQ(exec({"init"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("Initialized empty savepoint repository"));
    EXPECT_EQ(exec({"init"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("already initialized"));
}

TEST_F(CliTest, UsageErrorsShowSynopsis) {
    ASSERT_EQ(exec({"init"}), 0);
    EXPECT_EQ(exec({"save"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("usage: savepoint save <label...>"));
    EXPECT_EQ(exec({"checkout"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("usage: savepoint checkout <id>"));
}

TEST_F(CliTest, SaveWithNothingToSaveFails) {
    ASSERT_EQ(exec({"init"}), 0);
    EXPECT_EQ(exec({"save", "empty"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("No files to save"));
}

TEST_F(CliTest, SaveListCheckoutFlow) {
    ASSERT_EQ(exec({"init"}), 0);

    write("notes.txt", "first\n");
    ASSERT_EQ(exec({"save", "first", "version"}), 0) << err.str();
    EXPECT_THAT(out.str(), HasSubstr("'first version' (1 files)"));
    const auto first = savedId();

    write("notes.txt", "first\nsecond\n");
    write("new.txt", "new\n");
    ASSERT_EQ(exec({"save", "second"}), 0) << err.str();
    const auto second = savedId();

    ASSERT_EQ(exec({"list"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("LABEL"));
    EXPECT_THAT(out.str(), HasSubstr(first));
    EXPECT_THAT(out.str(), HasSubstr("first version"));
    EXPECT_LT(out.str().find(first), out.str().find(second));

    ASSERT_EQ(exec({"checkout", first}), 0) << err.str();
    EXPECT_THAT(out.str(), HasSubstr("Checked out " + first));
    EXPECT_EQ(read("notes.txt"), "first\n");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "new.txt"));

    ASSERT_EQ(exec({"now"}), 0) << err.str();
    EXPECT_THAT(out.str(), HasSubstr("Checked out " + second));
    EXPECT_EQ(read("notes.txt"), "first\nsecond\n");
    EXPECT_EQ(read("new.txt"), "new\n");

    ASSERT_EQ(exec({"stats", second}), 0) << err.str();
    EXPECT_THAT(out.str(), HasSubstr("notes.txt"));
    EXPECT_THAT(out.str(), HasSubstr("Total:"));

    EXPECT_EQ(exec({"checkout", "000000000000"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("not found"));
}

TEST_F(CliTest, NowWithoutSaves) {
    ASSERT_EQ(exec({"init"}), 0);
    ASSERT_EQ(exec({"now"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("No saves to check out"));
}

TEST_F(CliTest, CheckIgnore) {
    ASSERT_EQ(exec({"init"}), 0);
    write(".savepointignore", "*.log\n");
    ASSERT_EQ(exec({"check-ignore", "app.log", "main.cpp"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("ignored\tapp.log"));
    EXPECT_THAT(out.str(), HasSubstr("tracked\tmain.cpp"));
}

TEST_F(CliTest, ConfigPrintsEffectiveSettings) {
    ASSERT_EQ(exec({"init"}), 0);
    write(".savepoint/config.yaml", "storage:\n  max_chain_length: 4\n");
    ASSERT_EQ(exec({"config"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("\"max_chain_length\": 4"));
}

TEST_F(CliTest, BrokenConfigIsReported) {
    ASSERT_EQ(exec({"init"}), 0);
    write(".savepoint/config.yaml", "storage:\n  compression_level: 77\n");
    EXPECT_EQ(exec({"list"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("compression_level"));
}
