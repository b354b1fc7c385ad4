#include <gtest/gtest.h>

#include "crypto/sha256.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fwunpack {
namespace {

std::span<const std::uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(Sha256Test, KnownVector) {
    EXPECT_EQ(Sha256Hex(AsBytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223"
              "b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::span<const std::uint8_t>()),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const std::string input = "firmware region split across chunks";
    Sha256Hasher hasher;
    hasher.Update(AsBytes(input.substr(0, 7)));
    hasher.Update(AsBytes(input.substr(7)));
    EXPECT_EQ(hasher.FinalHex(), Sha256Hex(AsBytes(input)));
    // finalized hashers yield nothing further
    EXPECT_EQ(hasher.FinalHex(), "");
}

} // namespace
} // namespace fwunpack
