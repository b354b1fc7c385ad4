#include "fwunpack/partition_manifest.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>

namespace fwunpack {
namespace {

PartitionInfo SamplePartition() {
    PartitionInfo p;
    p.name = "uboot";
    p.path = "Image/uboot.img";
    p.flash_size = 0x2000;
    p.flash_offset = 0x4000;
    p.part_offset = 0xa00;
    p.padded_size = 0x9e00;
    p.part_byte_count = 0x9c40;
    return p;
}

TEST(PartitionManifestTest, FormatsFixedWidthHexFields) {
    EXPECT_EQ(FormatManifestLine(SamplePartition()),
              "uboot,Image/uboot.img,0x00002000,0x00004000,0x00000a00,0x00009e00,0x00009c40");
}

TEST(PartitionManifestTest, WriterAppendsLinesInOrder) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/partition-metadata.txt";

    PartitionManifestWriter writer;
    ASSERT_TRUE(PartitionManifestWriter::Open(path, writer).ok);
    auto a = SamplePartition();
    auto b = SamplePartition();
    b.name = "boot";
    b.path = "Image/boot.img";
    ASSERT_TRUE(writer.Append(a).ok);
    ASSERT_TRUE(writer.Append(b).ok);

    // each line is flushed as it is appended
    EXPECT_EQ(testutil::ReadTextFile(path), FormatManifestLine(a) + "\n" + FormatManifestLine(b) + "\n");
}

} // namespace
} // namespace fwunpack
