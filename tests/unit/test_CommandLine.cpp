#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "runtime/CommandLine.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

using namespace pfs::runtime;

namespace {

// fuse_opt_parse wants a mutable argv
class Argv {
public:
    Argv(std::initializer_list<std::string> args) {
        for (const auto& a : args) {
            auto buf = std::make_unique<char[]>(a.size() + 1);
            std::memcpy(buf.get(), a.c_str(), a.size() + 1);
            ptrs_.push_back(buf.get());
            owned_.push_back(std::move(buf));
        }
        ptrs_.push_back(nullptr);
    }

    [[nodiscard]] int argc() const { return static_cast<int>(owned_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::unique_ptr<char[]>> owned_;
    std::vector<char*> ptrs_;
};

std::optional<CommandLine> parse(Argv args) {
    return parseCommandLine(args.argc(), args.argv());
}

}

TEST(CommandLineTest, TokenAndMountPoint) {
    const auto cli = parse({"putiofs", "-token", "abc", "/mnt/putio"});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->token, "abc");
    EXPECT_EQ(cli->mountPoint, "/mnt/putio");
    EXPECT_FALSE(cli->debug);
    EXPECT_FALSE(cli->readOnly);
}

TEST(CommandLineTest, TokenWithEqualsSign) {
    for (const auto* flag : {"-token=xyz", "--token=xyz"}) {
        const auto cli = parse({"putiofs", flag, "/mnt"});
        ASSERT_TRUE(cli) << flag;
        EXPECT_EQ(cli->token, "xyz") << flag;
    }
}

TEST(CommandLineTest, FlagsAnywhere) {
    const auto cli = parse({"putiofs", "/mnt", "-debug", "--readonly", "-config", "/etc/putiofs.yaml"});
    ASSERT_TRUE(cli);
    EXPECT_TRUE(cli->debug);
    EXPECT_TRUE(cli->readOnly);
    EXPECT_EQ(cli->configPath, std::filesystem::path("/etc/putiofs.yaml"));
    EXPECT_FALSE(cli->token);
}

TEST(CommandLineTest, MountPointIsRequired) {
    EXPECT_FALSE(parse({"putiofs", "-token", "abc"}));
}

TEST(CommandLineTest, OnlyOneMountPoint) {
    EXPECT_FALSE(parse({"putiofs", "-token", "abc", "/a", "/b"}));
}

TEST(CommandLineTest, UnknownOptionIsRejected) {
    EXPECT_FALSE(parse({"putiofs", "-verbose", "/mnt"}));
}

TEST(CommandLineTest, HelpNeedsNoMountPoint) {
    const auto cli = parse({"putiofs", "-h"});
    ASSERT_TRUE(cli);
    EXPECT_TRUE(cli->showHelp);
}

TEST(CommandLineTest, UsageNamesEveryOption) {
    std::ostringstream os;
    printUsage(os, "putiofs");
    const auto text = os.str();
    for (const auto* opt : {"-token", "-config", "-readonly", "-debug", "MOUNTPOINT"})
        EXPECT_NE(text.find(opt), std::string::npos) << opt;
}

TEST(CommandLineTest, CommandLineOverridesConfigFile) {
    CommandLine cli;
    cli.token = "from-cli";
    cli.readOnly = true;
    cli.configPath = std::filesystem::temp_directory_path() / "putiofs-cli-test.yaml";
    {
        std::ofstream out(*cli.configPath);
        out << "api:\n  token: from-file\n  user_agent: custom\n";
    }

    const auto cfg = resolveConfig(cli);
    std::filesystem::remove(*cli.configPath);

    EXPECT_EQ(cfg.api.token, "from-cli");
    EXPECT_EQ(cfg.api.user_agent, "custom");
    EXPECT_TRUE(cfg.fuse.read_only);
}
