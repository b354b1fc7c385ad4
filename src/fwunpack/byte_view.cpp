#include "fwunpack/byte_view.hpp"

#include <algorithm>
#include <cstdio>

namespace fwunpack {

std::optional<std::uint8_t> ByteView::U8(size_t offset) const {
    if (!Has(offset, 1)) return std::nullopt;
    return data_[offset];
}

std::optional<std::uint16_t> ByteView::U16Le(size_t offset) const {
    if (!Has(offset, 2)) return std::nullopt;
    return static_cast<std::uint16_t>(data_[offset] |
                                      (static_cast<std::uint16_t>(data_[offset + 1]) << 8));
}

std::optional<std::uint32_t> ByteView::U32Le(size_t offset) const {
    if (!Has(offset, 4)) return std::nullopt;
    return static_cast<std::uint32_t>(data_[offset]) |
           (static_cast<std::uint32_t>(data_[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data_[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data_[offset + 3]) << 24);
}

std::optional<std::span<const std::uint8_t>> ByteView::Bytes(size_t offset, size_t len) const {
    if (!Has(offset, len)) return std::nullopt;
    return data_.subspan(offset, len);
}

bool IsValidUtf8(std::span<const std::uint8_t> bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t c = bytes[i];
        size_t extra = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (bytes.size() - i <= extra) return false;
        for (size_t k = 1; k <= extra; ++k) {
            const std::uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        static constexpr std::uint32_t kMin[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMin[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::optional<std::string> DecodeFixedText(std::span<const std::uint8_t> field) {
    const auto nul = std::find(field.begin(), field.end(), std::uint8_t{0});
    const auto text = field.first(static_cast<size_t>(nul - field.begin()));
    if (!IsValidUtf8(text)) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(text.data()), text.size());
}

std::optional<std::string> DecodeTerminatedText(std::span<const std::uint8_t> field) {
    if (std::find(field.begin(), field.end(), std::uint8_t{0}) == field.end()) return std::nullopt;
    return DecodeFixedText(field);
}

std::string DescribeBytes(std::span<const std::uint8_t> bytes) {
    std::string hex;
    std::string ascii;
    char tmp[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(tmp, sizeof(tmp), "%02x", bytes[i]);
        if (i) hex.push_back(' ');
        hex += tmp;
        ascii.push_back((bytes[i] >= 0x20 && bytes[i] < 0x7f) ? static_cast<char>(bytes[i]) : '.');
    }
    if (bytes.empty()) return "<empty>";
    return hex + " (" + ascii + ")";
}

} // namespace fwunpack
