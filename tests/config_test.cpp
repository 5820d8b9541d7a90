#include "src/server/config.h"
#include "src/server/process.h"

#include <gtest/gtest.h>

namespace evalbox {
namespace {

TEST(ConfigTest, DefaultsAreUsable) {
    EngineConfig config = DefaultConfig();

    EXPECT_EQ(ValidateConfig(config), "");
    EXPECT_EQ(config.execution_timeout_seconds(), 30u);
    EXPECT_EQ(config.memory_limit_bytes(), 256ull * 1024 * 1024);
    EXPECT_EQ(config.cpu_quota_micros(), 50000u);
    EXPECT_EQ(config.cpu_period_micros(), 100000u);
    EXPECT_EQ(config.sandbox_ttl_seconds(), 300u);
    EXPECT_EQ(config.reaper_interval_seconds(), 60u);
    EXPECT_EQ(config.backend(), EngineConfig::DOCKER);
    EXPECT_EQ(config.docker_image(), "python:3.11-slim");
    EXPECT_EQ(config.entry_point(), "solution");
    EXPECT_EQ(config.listen_address(), "0.0.0.0:50051");
    EXPECT_EQ(config.log_level(), EngineConfig::LOG_INFO);
}

TEST(ConfigTest, TextOverridesDefaults) {
    EngineConfig config;
    std::string error;
    ASSERT_TRUE(ParseConfig(R"(
        execution_timeout_seconds: 5
        memory_limit_bytes: 67108864
        backend: NAMESPACE
        entry_point: "two_sum"
        log_level: LOG_DEBUG
    )", &config, &error)) << error;

    EXPECT_EQ(config.execution_timeout_seconds(), 5u);
    EXPECT_EQ(config.memory_limit_bytes(), 67108864u);
    EXPECT_EQ(config.backend(), EngineConfig::NAMESPACE);
    EXPECT_EQ(config.entry_point(), "two_sum");
    EXPECT_EQ(ToLogLevel(config.log_level()), LogLevel::DEBUG);
    // Untouched fields still get their defaults.
    EXPECT_EQ(config.sandbox_ttl_seconds(), 300u);
}

TEST(ConfigTest, UnknownFieldIsRejectedWithPosition) {
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(ParseConfig("execution_timeout_seconds: 5\nbogus_field: 1\n", &config, &error));
    EXPECT_NE(error.find("line 2"), std::string::npos) << error;
    EXPECT_NE(error.find("bogus_field"), std::string::npos) << error;
}

TEST(ConfigTest, TimeoutMustBeShorterThanTtl) {
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(ParseConfig("execution_timeout_seconds: 300\nsandbox_ttl_seconds: 300\n", &config, &error));
    EXPECT_EQ(error, "execution_timeout_seconds must be shorter than sandbox_ttl_seconds");
}

TEST(ConfigTest, ZeroLimitsAreRejected) {
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(ParseConfig("memory_limit_bytes: 0\n", &config, &error));
    EXPECT_EQ(error, "memory_limit_bytes must be positive");
    EXPECT_FALSE(ParseConfig("max_concurrent_executions: 0\n", &config, &error));
}

TEST(ConfigTest, EntryPointMustBeAnIdentifier) {
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(ParseConfig("entry_point: \"1st\"\n", &config, &error));
    EXPECT_FALSE(ParseConfig("entry_point: \"os.system\"\n", &config, &error));
    EXPECT_NE(error.find("not a valid Python identifier"), std::string::npos) << error;
    EXPECT_TRUE(ParseConfig("entry_point: \"_solve2\"\n", &config, &error)) << error;
}

TEST(ConfigTest, FailedParseLeavesConfigUntouched) {
    EngineConfig config = DefaultConfig();
    std::string error;

    EXPECT_FALSE(ParseConfig("execution_timeout_seconds: 999\n", &config, &error));
    EXPECT_EQ(config.execution_timeout_seconds(), 30u);
}

TEST(ConfigTest, LoadReadsFileAndNamesItInErrors) {
    std::string directory = Process::CreateTempDirectory();
    ASSERT_FALSE(directory.empty());
    std::string good = directory + "/good.textproto";
    std::string bad = directory + "/bad.textproto";
    ASSERT_TRUE(Process::WriteFile(good, "reaper_interval_seconds: 5\n"));
    ASSERT_TRUE(Process::WriteFile(bad, "reaper_interval_seconds: 0\n"));

    EngineConfig config;
    std::string error;
    EXPECT_TRUE(LoadConfig(good, &config, &error)) << error;
    EXPECT_EQ(config.reaper_interval_seconds(), 5u);

    EXPECT_FALSE(LoadConfig(bad, &config, &error));
    EXPECT_EQ(error, bad + ": reaper_interval_seconds must be positive");

    EXPECT_FALSE(LoadConfig(directory + "/missing.textproto", &config, &error));
    EXPECT_EQ(error, "cannot open " + directory + "/missing.textproto");

    Process::RemoveDirectory(directory);
}

TEST(ConfigTest, ShippedConfigMatchesDefaults) {
    EngineConfig config;
    std::string error;
    ASSERT_TRUE(LoadConfig(std::string(EVALBOX_SOURCE_DIR) + "/config/evalboxd.textproto", &config, &error))
        << error;

    EXPECT_EQ(config.SerializeAsString(), DefaultConfig().SerializeAsString());
}

TEST(ConfigTest, SandboxOptionsFollowTheConfig) {
    EngineConfig config = DefaultConfig();
    config.set_memory_limit_bytes(1024);
    config.set_max_processes(8);
    config.set_execution_timeout_seconds(7);
    config.set_sandbox_ttl_seconds(60);

    SandboxOptions options = MakeSandboxOptions(config);

    EXPECT_EQ(options.limits.memory_bytes, 1024u);
    EXPECT_EQ(options.limits.max_processes, 8u);
    EXPECT_TRUE(options.limits.network_disabled);
    EXPECT_TRUE(options.limits.read_only_mount);
    EXPECT_EQ(options.default_timeout, std::chrono::seconds(7));
    EXPECT_EQ(options.ttl, std::chrono::seconds(60));
}

TEST(ConfigTest, BackendSelection) {
    EngineConfig config = DefaultConfig();
    EXPECT_EQ(MakeBackend(config)->Name(), "docker");

    config.set_backend(EngineConfig::NAMESPACE);
    EXPECT_EQ(MakeBackend(config)->Name(), "namespace");
}

} // namespace
} // namespace evalbox
