#include "fwunpack/summary_json.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace fwunpack {
namespace {

using json = nlohmann::json;

WrapperInfo SampleWrapper() {
    WrapperInfo info;
    info.version = "8.1.4660";
    info.code = 0x01030000;
    info.timestamp = 1710498030;
    info.chip_family = "RK3566";
    info.chip_code = 0x38;
    info.chip_recognized = true;
    info.boot_offset = 0x66;
    info.boot_size = 5004;
    info.update_offset = 0x66 + 5004;
    info.update_size = 6144;
    return info;
}

PackageInfo SamplePackage() {
    PackageInfo info;
    info.manufacturer = "RockChip";
    info.model = "RK3566";
    info.version = "1.0.3";
    info.filesize = 8196;
    info.declared_length = 8192;
    info.length_consistent = true;

    PartitionInfo p;
    p.name = "boot";
    p.path = "Image/boot.img";
    p.flash_size = 0x8000;
    p.flash_offset = 0x2000;
    p.part_offset = 0x800;
    p.padded_size = 3072;
    p.part_byte_count = 3000;
    info.partitions.push_back(p);
    return info;
}

TEST(SummaryJsonTest, WrapperFieldsAreReported) {
    const json j = ToJson(UnpackResult{SampleWrapper()});

    EXPECT_EQ(j.at("format"), "wrapper");
    EXPECT_EQ(j.at("version"), "8.1.4660");
    EXPECT_EQ(j.at("code").get<std::uint32_t>(), 0x01030000U);
    EXPECT_EQ(j.at("timestamp").get<std::int64_t>(), 1710498030);
    EXPECT_EQ(j.at("chip_family"), "RK3566");
    EXPECT_EQ(j.at("chip_code").get<int>(), 0x38);
    EXPECT_TRUE(j.at("chip_recognized").get<bool>());
    EXPECT_EQ(j.at("boot").at("offset").get<std::uint32_t>(), 0x66U);
    EXPECT_EQ(j.at("embedded_update").at("size").get<std::uint32_t>(), 6144U);
    EXPECT_FALSE(j.at("boot").contains("sha256"));
}

TEST(SummaryJsonTest, PackageListsPartitionsInOrder) {
    auto info = SamplePackage();
    info.partitions[0].sha256 = std::string(64, 'a');
    const json j = ToJson(UnpackResult{info});

    EXPECT_EQ(j.at("format"), "package");
    EXPECT_EQ(j.at("manufacturer"), "RockChip");
    EXPECT_EQ(j.at("filesize").get<std::uint64_t>(), 8196U);
    EXPECT_TRUE(j.at("length_consistent").get<bool>());
    ASSERT_EQ(j.at("partitions").size(), 1U);

    const auto& part = j.at("partitions")[0];
    EXPECT_EQ(part.at("name"), "boot");
    EXPECT_EQ(part.at("path"), "Image/boot.img");
    EXPECT_EQ(part.at("part_byte_count").get<std::uint32_t>(), 3000U);
    EXPECT_EQ(part.at("sha256"), std::string(64, 'a'));
}

TEST(SummaryJsonTest, EmptyPackageHasEmptyPartitionArray) {
    PackageInfo info;
    const json j = ToJson(info);
    ASSERT_TRUE(j.at("partitions").is_array());
    EXPECT_TRUE(j.at("partitions").empty());
}

TEST(SummaryJsonTest, WritesParseableFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/summary.json";

    auto r = WriteSummaryJson(UnpackResult{SamplePackage()}, path);
    ASSERT_TRUE(r.ok) << r.msg;

    const json j = json::parse(testutil::ReadTextFile(path));
    EXPECT_EQ(j.at("model"), "RK3566");
    EXPECT_EQ(j.at("partitions")[0].at("flash_offset").get<std::uint32_t>(), 0x2000U);
}

TEST(SummaryJsonTest, UnwritableDestinationFails) {
    testutil::TemporaryDirectory tmp;
    auto r = WriteSummaryJson(UnpackResult{SampleWrapper()}, tmp.Path() + "/missing/summary.json");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::Io);
}

} // namespace
} // namespace fwunpack
