#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>

namespace fwunpack {
namespace {

namespace fs = std::filesystem;

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

// Runs the tool with the given arguments and an empty config search path.
int RunTool(const std::string& args) {
    const std::string cmd = "FWUNPACK_CONFIG_PATH= " + ShellQuote(FWUNPACK_TOOL_BIN) + " " + args +
                            " >/dev/null 2>&1";
    return ExitCodeFromSystem(std::system(cmd.c_str()));
}

TEST(MainCliTest, UnpacksWrapperAndNestedPackage) {
    testutil::TemporaryDirectory tmp;
    const fs::path base(tmp.Path());
    const auto spec = testutil::DefaultWrapperSpec();
    ASSERT_TRUE(testutil::WriteBytesFile((base / "fw.img").string(),
                                         testutil::BuildWrapperImage(spec).bytes));

    ASSERT_EQ(RunTool("-i " + ShellQuote((base / "fw.img").string()) + " -o " +
                      ShellQuote((base / "out").string())),
              0);
    EXPECT_EQ(testutil::ReadBytesFile((base / "out" / "BOOT").string()), spec.boot);
    EXPECT_EQ(testutil::ReadBytesFile((base / "out" / "embedded-update.img").string()),
              spec.embedded);

    ASSERT_EQ(RunTool("-i " + ShellQuote((base / "out" / "embedded-update.img").string()) +
                      " -o " + ShellQuote((base / "pkg").string())),
              0);
    EXPECT_EQ(testutil::ReadBytesFile((base / "pkg" / "Image" / "boot.img").string()),
              testutil::Pattern(3000, 9));
    EXPECT_TRUE(fs::exists(base / "pkg" / "partition-metadata.txt"));
}

TEST(MainCliTest, WritesJsonSummaryWithDigests) {
    testutil::TemporaryDirectory tmp;
    const fs::path base(tmp.Path());
    const auto spec = testutil::DefaultPackageSpec();
    ASSERT_TRUE(testutil::WriteBytesFile((base / "update.img").string(),
                                         testutil::BuildPackageImage(spec).bytes));

    const fs::path summary = base / "summary.json";
    ASSERT_EQ(RunTool("-s -i " + ShellQuote((base / "update.img").string()) + " -o " +
                      ShellQuote((base / "out").string()) + " -j " +
                      ShellQuote(summary.string())),
              0);

    const auto j = nlohmann::json::parse(testutil::ReadTextFile(summary.string()));
    EXPECT_EQ(j.at("format"), "package");
    EXPECT_EQ(j.at("manufacturer"), "RockChip");
    ASSERT_EQ(j.at("partitions").size(), spec.parts.size());
    for (size_t i = 0; i < spec.parts.size(); ++i) {
        const auto& part = j.at("partitions")[i];
        EXPECT_EQ(part.at("path"), spec.parts[i].path);
        EXPECT_EQ(part.at("sha256"), Sha256Hex(spec.parts[i].payload));
    }
}

TEST(MainCliTest, ListModeWritesNothing) {
    testutil::TemporaryDirectory tmp;
    const fs::path base(tmp.Path());
    ASSERT_TRUE(testutil::WriteBytesFile(
        (base / "fw.img").string(),
        testutil::BuildWrapperImage(testutil::DefaultWrapperSpec()).bytes));

    ASSERT_EQ(RunTool("-l -i " + ShellQuote((base / "fw.img").string()) + " -o " +
                      ShellQuote((base / "out").string())),
              0);
    EXPECT_FALSE(fs::exists(base / "out"));
}

TEST(MainCliTest, FailuresExitWithOne) {
    testutil::TemporaryDirectory tmp;
    const fs::path base(tmp.Path());
    ASSERT_TRUE(testutil::WriteBytesFile((base / "junk.bin").string(), testutil::Pattern(64, 3)));

    EXPECT_EQ(RunTool("-i " + ShellQuote((base / "junk.bin").string()) + " -o " +
                      ShellQuote((base / "out").string())),
              1);
    EXPECT_FALSE(fs::exists(base / "out"));

    EXPECT_EQ(RunTool("-i " + ShellQuote((base / "absent.img").string()) + " -o " +
                      ShellQuote((base / "out").string())),
              1);
}

TEST(MainCliTest, ExplicitBadConfigIsFatal) {
    testutil::TemporaryDirectory tmp;
    const fs::path base(tmp.Path());
    ASSERT_TRUE(testutil::WriteBytesFile(
        (base / "update.img").string(),
        testutil::BuildPackageImage(testutil::DefaultPackageSpec()).bytes));
    {
        std::ofstream os(base / "bad.conf");
        os << R"({"ChunkSize": 1})";
    }

    EXPECT_EQ(RunTool("-c " + ShellQuote((base / "bad.conf").string()) + " -i " +
                      ShellQuote((base / "update.img").string()) + " -o " +
                      ShellQuote((base / "out").string())),
              1);
    EXPECT_FALSE(fs::exists(base / "out"));
}

TEST(MainCliTest, UsageErrorsExitWithTwo) {
    EXPECT_EQ(RunTool(""), 2);
    EXPECT_EQ(RunTool("-i /nonexistent"), 2);
    EXPECT_EQ(RunTool("-o /tmp/x"), 2);
    EXPECT_EQ(RunTool("--bogus"), 2);
    EXPECT_EQ(RunTool("-h"), 0);
}

} // namespace
} // namespace fwunpack
