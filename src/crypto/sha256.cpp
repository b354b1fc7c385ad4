#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>

namespace fwunpack {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

using Digest = std::array<std::uint8_t, 32>;

bool Init(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool Update(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool Final(EvpCtx& ctx, Digest& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->failed = !Init(impl_->ctx);
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->failed || impl_->finalized) return;
    if (!fwunpack::Update(impl_->ctx, data)) {
        impl_->failed = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->failed || impl_->finalized) return {};
    impl_->finalized = true;
    Digest digest{};
    if (!Final(impl_->ctx, digest)) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

} // namespace fwunpack
