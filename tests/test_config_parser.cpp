#include "util/config_parser.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>

namespace fwunpack::config {
namespace {

class ConfigParserTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string WriteConfig(const std::string& text) {
        const std::string path = tmp.Path() + "/fwunpack.conf";
        std::ofstream os(path, std::ios::trunc);
        os << text;
        return path;
    }

    void TearDown() override { ::unsetenv(kConfigPathEnv); }
};

TEST_F(ConfigParserTest, LoadsAllKeys) {
    const auto path = WriteConfig(R"({
        "ChunkSize": 65536,
        "LogLevel": "debug",
        "ComputeDigests": true,
        "Progress": false,
        "SafePathsOnly": false
    })");

    UnpackerConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.chunk_size, 65536U);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.compute_digests, true);
    EXPECT_EQ(cfg.progress, false);
    EXPECT_EQ(cfg.safe_paths_only, false);
}

TEST_F(ConfigParserTest, MissingKeysStayUnset) {
    const auto path = WriteConfig(R"({"LogLevel": "WARN"})");

    UnpackerConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(path).ok);
    EXPECT_EQ(cfg.log_level, LogLevel::Warn);
    EXPECT_FALSE(cfg.chunk_size.has_value());
    EXPECT_FALSE(cfg.compute_digests.has_value());
    EXPECT_FALSE(cfg.progress.has_value());
    EXPECT_FALSE(cfg.safe_paths_only.has_value());
}

TEST_F(ConfigParserTest, UnknownLogLevelIsRejected) {
    UnpackerConfigFromFile cfg;
    auto r = cfg.LoadFile(WriteConfig(R"({"LogLevel": "verbose"})"));
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::InvalidConfig);
    EXPECT_NE(r.msg.find("verbose"), std::string::npos);
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST_F(ConfigParserTest, ChunkSizeOutsideRangeIsRejected) {
    UnpackerConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadFile(WriteConfig(R"({"ChunkSize": 100})")).ok);
    EXPECT_FALSE(cfg.LoadFile(WriteConfig(R"({"ChunkSize": 134217728})")).ok);
    EXPECT_FALSE(cfg.LoadFile(WriteConfig(R"({"ChunkSize": -1})")).ok);
    EXPECT_TRUE(cfg.LoadFile(WriteConfig(R"({"ChunkSize": 512})")).ok);
}

TEST_F(ConfigParserTest, WrongTypeIsRejectedAndResets) {
    UnpackerConfigFromFile cfg;
    auto r = cfg.LoadFile(WriteConfig(R"({"LogLevel": "info", "Progress": "yes"})"));
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::InvalidConfig);
    EXPECT_NE(r.msg.find("Progress"), std::string::npos);
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST_F(ConfigParserTest, MalformedOrMissingFileFails) {
    UnpackerConfigFromFile cfg;
    EXPECT_EQ(cfg.LoadFile(WriteConfig("{not json")).code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadFile(WriteConfig("[1, 2]")).code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadFile(tmp.Path() + "/absent.conf").code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigParserTest, BrokenDefaultFileFallsBackWithWarning) {
    const auto path = WriteConfig(R"({"ChunkSize": 1, "LogLevel": "debug"})");

    UnpackerConfigFromFile cfg;
    std::string warning;
    auto r = LoadResolvedConfig(path, false, cfg, warning);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_NE(warning.find("ChunkSize"), std::string::npos) << warning;
    EXPECT_FALSE(cfg.chunk_size.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST_F(ConfigParserTest, MissingDefaultFileIsSilent) {
    UnpackerConfigFromFile cfg;
    std::string warning = "stale";
    auto r = LoadResolvedConfig(tmp.Path() + "/absent.conf", false, cfg, warning);
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(warning.empty());
}

TEST_F(ConfigParserTest, BrokenExplicitFileFails) {
    UnpackerConfigFromFile cfg;
    std::string warning;
    auto r = LoadResolvedConfig(WriteConfig("{not json"), true, cfg, warning);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(warning.empty());

    r = LoadResolvedConfig(WriteConfig(R"({"Progress": true})"), true, cfg, warning);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.progress, true);
}

TEST_F(ConfigParserTest, ResolvePathPrefersCliThenEnvironment) {
    bool explicit_path = false;

    ::unsetenv(kConfigPathEnv);
    EXPECT_EQ(ResolveConfigPath(nullptr, explicit_path), kDefaultConfigPath);
    EXPECT_FALSE(explicit_path);

    ::setenv(kConfigPathEnv, "/tmp/from-env.conf", 1);
    EXPECT_EQ(ResolveConfigPath(nullptr, explicit_path), "/tmp/from-env.conf");
    EXPECT_TRUE(explicit_path);

    EXPECT_EQ(ResolveConfigPath("/tmp/from-cli.conf", explicit_path), "/tmp/from-cli.conf");
    EXPECT_TRUE(explicit_path);

    EXPECT_EQ(ResolveConfigPath("", explicit_path), "/tmp/from-env.conf");
}

} // namespace
} // namespace fwunpack::config
