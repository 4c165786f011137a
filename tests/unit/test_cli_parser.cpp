#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/continuity_errors.hpp"

namespace {

using continuity::app::cli::parse_and_validate;
using continuity::app::cli::ServerOptions;
using continuity::core::errors::ErrorKind;
using continuity::core::errors::get_error;
using continuity::core::errors::get_value;
using continuity::core::errors::is_error;

continuity::core::errors::Result<ServerOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("continuity_mcp");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("CONTINUITY_ENGINE_DIR"); }
    void TearDown() override { unsetenv("CONTINUITY_ENGINE_DIR"); }
};

TEST_F(CliParserTest, ExplicitEngineDirDerivesConfigPath) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.engine_dir, std::filesystem::path("/opt/engine"));
    EXPECT_EQ(options.config_path,
              std::filesystem::path("/opt/engine/config/default_config.json"));
    EXPECT_FALSE(options.socket_path.has_value());
    EXPECT_FALSE(options.timeout_ms.has_value());
    EXPECT_FALSE(options.intake_workers.has_value());
    EXPECT_FALSE(options.verbose);
}

TEST_F(CliParserTest, EngineDirFallsBackToEnvironment) {
    setenv("CONTINUITY_ENGINE_DIR", "/srv/continuity", 1);
    auto result = parse_tokens({});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).engine_dir, std::filesystem::path("/srv/continuity"));
}

TEST_F(CliParserTest, ParsesAllFlags) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine", "--config", "/etc/ctx.json",
                                "--socket", "/run/engine.sock", "--timeout-ms", "1500",
                                "--workers", "8", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.config_path, std::filesystem::path("/etc/ctx.json"));
    ASSERT_TRUE(options.socket_path.has_value());
    EXPECT_EQ(options.socket_path.value(), std::filesystem::path("/run/engine.sock"));
    EXPECT_EQ(options.timeout_ms.value(), 1500u);
    EXPECT_EQ(options.intake_workers.value(), 8u);
    EXPECT_TRUE(options.verbose);
}

TEST_F(CliParserTest, SequentialMeansZeroIntakeWorkers) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine", "--sequential"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).intake_workers.value(), 0u);
}

TEST_F(CliParserTest, FailsWhenWorkersAndSequentialBothProvided) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine", "--workers", "2", "--sequential"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST_F(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine", "--timeout-ms", "soon"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Config);
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST_F(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto zero = parse_tokens({"--engine-dir", "/opt/engine", "--timeout-ms", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto workers = parse_tokens({"--engine-dir", "/opt/engine", "--workers", "65"});
    ASSERT_TRUE(is_error(workers));
    EXPECT_EQ(get_error(workers).code, "bounds_error");
}

TEST_F(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"--engine-dir"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST_F(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"--engine-dir", "/opt/engine", "--daemonize"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
    EXPECT_FALSE(get_error(result).hint.empty());
}

}  // namespace
