#include <gtest/gtest.h>

#include "coordination/CoordinationOptions.hpp"
#include "options/Options.hpp"
#include "test_utils.hpp"

#include <fstream>
#include <string>
#include <vector>

using coordination::CoordinationMode;
using shared_opts::Options;

namespace {

Options::ParseResult parse(std::vector<std::string> args, std::string& err) {
    args.insert(args.begin(), "instance-coordinator");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
}

std::filesystem::path write_config(const std::filesystem::path& dir, const std::string& body) {
    auto path = dir / "config.json";
    std::ofstream(path) << body;
    return path;
}

class CoordinationOptionsTest : public ::testing::Test {
protected:
    void SetUp() override { coordination_opts::register_options(); }
};

} // namespace

TEST_F(CoordinationOptionsTest, Defaults) {
    std::string err;
    ASSERT_EQ(parse({}, err), Options::ParseResult::Ok) << err;
    auto settings = coordination_opts::build_settings();
    EXPECT_EQ(settings.mode, CoordinationMode::Auto);
    EXPECT_TRUE(settings.lock_dirs.empty());
    EXPECT_EQ(settings.connect.attempts, 20);
    EXPECT_EQ(settings.backlog, 128);
    EXPECT_FALSE(coordination_opts::get_group().has_value());
}

TEST_F(CoordinationOptionsTest, JsonSeedsDefaults) {
    test_utils::TempDir dir;
    auto cfg = write_config(dir.path(), R"({
        "coordination": { "group": "work", "mode": "filesystem",
                          "lock_dirs": ["/var/tmp", "locks"], "connect_attempts": 7 }
    })");

    std::string err;
    ASSERT_EQ(parse({"-c", cfg.string()}, err), Options::ParseResult::Ok) << err;
    auto settings = coordination_opts::build_settings();
    EXPECT_EQ(settings.mode, CoordinationMode::Filesystem);
    ASSERT_EQ(settings.lock_dirs.size(), 2u);
    EXPECT_EQ(settings.lock_dirs[0], std::filesystem::path("/var/tmp"));
    // Relative entries resolve against the config file's directory
    EXPECT_EQ(settings.lock_dirs[1], std::filesystem::absolute(cfg).parent_path() / "locks");
    EXPECT_EQ(settings.connect.attempts, 7);
    EXPECT_EQ(coordination_opts::get_group(), std::optional<std::string>("work"));
}

TEST_F(CoordinationOptionsTest, CommandLineOverridesJson) {
    test_utils::TempDir dir;
    auto cfg = write_config(dir.path(), R"({"coordination": {"mode": "filesystem", "lock_dirs": ["/var/tmp"]}})");

    std::string err;
    ASSERT_EQ(parse({"-c", cfg.string(), "--coordination-mode", "abstract", "--lock-dir", "/a", "--lock-dir", "/b",
                     "--instance-group", "g1"}, err),
              Options::ParseResult::Ok) << err;
    auto settings = coordination_opts::build_settings();
    EXPECT_EQ(settings.mode, CoordinationMode::Abstract);
    EXPECT_EQ(settings.lock_dirs, (std::vector<std::filesystem::path>{"/a", "/b"}));
    EXPECT_EQ(coordination_opts::get_group(), std::optional<std::string>("g1"));
}

TEST_F(CoordinationOptionsTest, InvalidValuesAreRejected) {
    std::string err;
    EXPECT_EQ(parse({"--coordination-mode", "sometimes"}, err), Options::ParseResult::Error);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(parse({"--connect-attempts", "0"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--no-such-flag"}, err), Options::ParseResult::Error);
}

TEST_F(CoordinationOptionsTest, BadJsonValuesKeepDefaults) {
    test_utils::TempDir dir;
    auto cfg = write_config(dir.path(), R"({"coordination": {"mode": "sometimes", "connect_attempts": 0, "group": 5}})");

    std::string err;
    ASSERT_EQ(parse({"-c", cfg.string()}, err), Options::ParseResult::Ok) << err;
    auto settings = coordination_opts::build_settings();
    EXPECT_EQ(settings.mode, CoordinationMode::Auto);
    EXPECT_EQ(settings.connect.attempts, 20);
    EXPECT_FALSE(coordination_opts::get_group().has_value());
}

TEST_F(CoordinationOptionsTest, ConfigFileProblems) {
    test_utils::TempDir dir;
    std::string err;
    EXPECT_EQ(parse({"-c", (dir.path() / "missing.json").string()}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("missing.json"), std::string::npos);

    auto broken = write_config(dir.path(), "{ not json");
    EXPECT_EQ(parse({"-c", broken.string()}, err), Options::ParseResult::Error);

    auto array = write_config(dir.path(), "[1, 2]");
    EXPECT_EQ(parse({"-c", array.string()}, err), Options::ParseResult::Error);
}
