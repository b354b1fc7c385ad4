#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace fwunpack {

// Lowercase hex SHA-256 of a buffer. Empty string if the digest cannot be computed.
std::string Sha256Hex(std::span<const std::uint8_t> data);

// Incremental SHA-256 for streamed regions.
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fwunpack
